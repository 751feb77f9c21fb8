#include "paramscript/parser.h"
#include "paramscript/errors.h"
#include "paramscript/grammar.h"
#include <peglib.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace paramscript {

// ============================================================================
// Grammar
// ============================================================================
// Precedence, lowest first: + -, * / // % @, unary signs, ** (right
// associative), postfix subscripts and .T. Inside $[...] items are separated
// by blanks or commas and rows by ';'. A sign preceded by a blank and followed
// by an operand starts a new item, so "1 -2" holds two items and "1 - 2" one
// (see separateArrayItems).

static const char* EXPRESSION_GRAMMAR = R"GRAMMAR(
    Start           <- Expression EndOfInput
    Expression      <- Additive
    Additive        <- Multiplicative (AddOp Multiplicative)*
    Multiplicative  <- Unary (MulOp Unary)*
    Unary           <- UnaryPrefix Unary / Power
    Power           <- Postfix (PowOp Unary)?
    Postfix         <- Primary PostfixOp*
    PostfixOp       <- SubscriptOp / TransposeOp
    SubscriptOp     <- '[' IndexItem (',' IndexItem)* ']'
    IndexItem       <- SliceItem / Expression
    SliceItem       <- SliceBound ':' SliceBound (':' SliceBound)?
    SliceBound      <- Expression?
    TransposeOp     <- < '.T' ![a-zA-Z0-9_] >

    Primary         <- ArrayLiteral / ListLiteral / Number / Boolean / NoneValue
                     / String / Call / Name / '(' Expression ')'
    Call            <- Identifier '(' Arguments? ')'
    Arguments       <- Expression (',' Expression)*

    ArrayLiteral    <- '$[' Rows? ']'
    NestedArray     <- '[' Rows? ']'
    Rows            <- Row (';' Row)*
    Row             <- RowItem (','? RowItem)*
    RowItem         <- RangeItem / NestedArray / Expression
    RangeItem       <- SignedNumber ':' SignedNumber (':' SignedNumber)?
    SignedNumber    <- < '-'? ([0-9]+ ('.' [0-9]*)? / '.' [0-9]+) ([eE] [-+]? [0-9]+)? >

    ListLiteral     <- '[' (Expression (',' Expression)* ','?)? ']'

    Number          <- < ([0-9]+ ('.' [0-9]*)? / '.' [0-9]+) ([eE] [-+]? [0-9]+)? >
    Boolean         <- < ('true' / 'True' / 'false' / 'False') ![a-zA-Z0-9_] >
    NoneValue       <- < ('None' / 'null') ![a-zA-Z0-9_] >
    String          <- < "'" ('\\' . / !"'" .)* "'" > / < '"' ('\\' . / !'"' .)* '"' >
    Name            <- Identifier
    Identifier      <- < [a-zA-Z_] [a-zA-Z0-9_]* >

    AddOp           <- < [-+] >
    MulOp           <- < '//' / '*' !'*' / '/' / '%' / '@' >
    PowOp           <- < '**' >
    UnaryPrefix     <- < [-+] >

    EndOfInput      <- !.
    %whitespace     <- [ \t\r\n]*
)GRAMMAR";

namespace {

// Value produced by a postfix operator
struct PostfixPart {
    bool transpose = false;
    std::vector<IndexItem> items;
};

using Rows = std::vector<std::vector<ExprPtr>>;

ExprPtr foldBinary(const peg::SemanticValues& vs) {
    auto result = std::any_cast<ExprPtr>(vs[0]);
    for (size_t i = 1; i + 1 < vs.size(); i += 2) {
        auto op = std::any_cast<std::string>(vs[i]);
        auto rhs = std::any_cast<ExprPtr>(vs[i + 1]);
        result = makeBinaryOp(op, result, rhs);
    }
    return result;
}

bool isOperandEnd(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' ||
           c == ')' || c == ']' || c == '\'' || c == '"';
}

// Rewrites the blank before a Matlab item boundary inside $[...] into a
// comma. Parentheses and subscripts inside the literal are left alone. The
// rewrite keeps the text length, so error columns are unchanged.
std::string separateArrayItems(const std::string& text) {
    std::string out = text;
    std::vector<char> contexts;  // 'A' array literal, 'P' parentheses or subscript
    char quote = 0;
    for (size_t i = 0; i < out.size(); ++i) {
        char c = out[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '[') {
            bool arrayStart = i > 0 && out[i - 1] == '$';
            bool nested = !contexts.empty() && contexts.back() == 'A' &&
                          (i == 0 || !isOperandEnd(out[i - 1]));
            contexts.push_back(arrayStart || nested ? 'A' : 'P');
        } else if (c == '(') {
            contexts.push_back('P');
        } else if (c == ']' || c == ')') {
            if (!contexts.empty()) contexts.pop_back();
        } else if ((c == '-' || c == '+') && !contexts.empty() && contexts.back() == 'A' &&
                   i > 0 && (out[i - 1] == ' ' || out[i - 1] == '\t') &&
                   i + 1 < out.size() && out[i + 1] != ' ' && out[i + 1] != '\t') {
            size_t j = i - 1;
            while (j > 0 && (out[j] == ' ' || out[j] == '\t')) --j;
            if (isOperandEnd(out[j])) out[i - 1] = ',';
        }
    }
    return out;
}

double tokenToDouble(const peg::SemanticValues& vs) {
    std::string token = vs.token_to_string();
    return std::strtod(token.c_str(), nullptr);
}

}  // namespace

// ============================================================================
// Parser Implementation
// ============================================================================

class ExpressionParser::Impl {
public:
    Impl() {
        initializeGrammar();
    }

    ParseResult parse(const std::string& text) {
        ParseResult result;
        if (!grammarValid_) {
            result.errorMessage = "expression grammar failed to load: " + lastError_;
            return result;
        }

        lastError_.clear();
        errorColumn_ = 0;
        ExprPtr expr;
        if (parser_.parse(separateArrayItems(text), expr) && expr) {
            result.success = true;
            result.expression = expr;
        } else {
            result.errorMessage = lastError_.empty() ? "syntax error" : lastError_;
            result.column = errorColumn_;
        }
        return result;
    }

    bool isGrammarValid() const { return grammarValid_; }
    std::string getLastError() const { return lastError_; }

private:
    peg::parser parser_;
    bool grammarValid_ = false;
    std::string lastError_;
    size_t errorColumn_ = 0;

    void initializeGrammar() {
        parser_.set_logger([this](size_t /*line*/, size_t col, const std::string& msg) {
            if (lastError_.empty()) {
                lastError_ = "column " + std::to_string(col) + ": " + msg;
                errorColumn_ = col;
            }
        });

        grammarValid_ = parser_.load_grammar(EXPRESSION_GRAMMAR);
        if (!grammarValid_) return;

        parser_["Start"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };
        parser_["Expression"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };
        parser_["Additive"] = [](const peg::SemanticValues& vs) {
            return foldBinary(vs);
        };
        parser_["Multiplicative"] = [](const peg::SemanticValues& vs) {
            return foldBinary(vs);
        };

        parser_["Unary"] = [](const peg::SemanticValues& vs) {
            if (vs.size() == 2) {
                return makeUnaryOp(std::any_cast<std::string>(vs[0]),
                                   std::any_cast<ExprPtr>(vs[1]));
            }
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Power"] = [](const peg::SemanticValues& vs) {
            auto base = std::any_cast<ExprPtr>(vs[0]);
            if (vs.size() == 3) {
                return makeBinaryOp("**", base, std::any_cast<ExprPtr>(vs[2]));
            }
            return base;
        };

        parser_["Postfix"] = [](const peg::SemanticValues& vs) {
            auto expr = std::any_cast<ExprPtr>(vs[0]);
            for (size_t i = 1; i < vs.size(); ++i) {
                auto part = std::any_cast<PostfixPart>(vs[i]);
                if (part.transpose) {
                    expr = makeExpr(Transpose{expr});
                } else {
                    expr = makeExpr(Subscript{expr, std::move(part.items)});
                }
            }
            return expr;
        };

        parser_["PostfixOp"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<PostfixPart>(vs[0]);
        };

        parser_["SubscriptOp"] = [](const peg::SemanticValues& vs) {
            PostfixPart part;
            for (const auto& v : vs) {
                part.items.push_back(std::any_cast<IndexItem>(v));
            }
            return part;
        };

        parser_["TransposeOp"] = [](const peg::SemanticValues&) {
            PostfixPart part;
            part.transpose = true;
            return part;
        };

        parser_["IndexItem"] = [](const peg::SemanticValues& vs) {
            if (vs.choice() == 0) {
                return std::any_cast<IndexItem>(vs[0]);
            }
            IndexItem item;
            item.index = std::any_cast<ExprPtr>(vs[0]);
            return item;
        };

        parser_["SliceItem"] = [](const peg::SemanticValues& vs) {
            IndexItem item;
            item.isSlice = true;
            item.start = std::any_cast<ExprPtr>(vs[0]);
            item.stop = std::any_cast<ExprPtr>(vs[1]);
            if (vs.size() > 2) item.step = std::any_cast<ExprPtr>(vs[2]);
            return item;
        };

        parser_["SliceBound"] = [](const peg::SemanticValues& vs) {
            return vs.empty() ? ExprPtr() : std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Primary"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Call"] = [](const peg::SemanticValues& vs) {
            auto name = std::any_cast<std::string>(vs[0]);
            std::vector<ExprPtr> args;
            if (vs.size() > 1) args = std::any_cast<std::vector<ExprPtr>>(vs[1]);
            return makeFunctionCall(name, std::move(args));
        };

        parser_["Arguments"] = [](const peg::SemanticValues& vs) {
            std::vector<ExprPtr> args;
            for (const auto& v : vs) args.push_back(std::any_cast<ExprPtr>(v));
            return args;
        };

        parser_["ArrayLiteral"] = [](const peg::SemanticValues& vs) {
            ArrayLiteral array;
            if (!vs.empty()) array.rows = std::any_cast<Rows>(vs[0]);
            array.nested = false;
            return makeExpr(std::move(array));
        };

        parser_["NestedArray"] = [](const peg::SemanticValues& vs) {
            ArrayLiteral array;
            if (!vs.empty()) array.rows = std::any_cast<Rows>(vs[0]);
            array.nested = true;
            return makeExpr(std::move(array));
        };

        parser_["Rows"] = [](const peg::SemanticValues& vs) {
            Rows rows;
            for (const auto& v : vs) rows.push_back(std::any_cast<std::vector<ExprPtr>>(v));
            return rows;
        };

        parser_["Row"] = [](const peg::SemanticValues& vs) {
            std::vector<ExprPtr> items;
            for (const auto& v : vs) items.push_back(std::any_cast<ExprPtr>(v));
            return items;
        };

        parser_["RowItem"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["RangeItem"] = [](const peg::SemanticValues& vs) {
            RangeLiteral range;
            range.start = std::any_cast<double>(vs[0]);
            if (vs.size() == 3) {
                range.step = std::any_cast<double>(vs[1]);
                range.stop = std::any_cast<double>(vs[2]);
            } else {
                range.step = 1.0;
                range.stop = std::any_cast<double>(vs[1]);
            }
            return makeExpr(range);
        };

        parser_["SignedNumber"] = [](const peg::SemanticValues& vs) {
            return tokenToDouble(vs);
        };

        parser_["ListLiteral"] = [](const peg::SemanticValues& vs) {
            ListLiteral list;
            for (const auto& v : vs) list.items.push_back(std::any_cast<ExprPtr>(v));
            return makeExpr(std::move(list));
        };

        parser_["Number"] = [](const peg::SemanticValues& vs) {
            return makeNumber(tokenToDouble(vs));
        };

        parser_["Boolean"] = [](const peg::SemanticValues& vs) {
            std::string token = vs.token_to_string();
            return makeExpr(BooleanLiteral{token == "true" || token == "True"});
        };

        parser_["NoneValue"] = [](const peg::SemanticValues&) {
            return makeExpr(NoneLiteral{});
        };

        parser_["String"] = [](const peg::SemanticValues& vs) {
            std::string token = vs.token_to_string();
            return makeString(ExpressionGrammar::unescapeQuoted(token.substr(1, token.size() - 2)));
        };

        parser_["Name"] = [](const peg::SemanticValues& vs) {
            return makeName(std::any_cast<std::string>(vs[0]));
        };

        auto token = [](const peg::SemanticValues& vs) {
            return vs.token_to_string();
        };
        parser_["Identifier"] = token;
        parser_["AddOp"] = token;
        parser_["MulOp"] = token;
        parser_["PowOp"] = token;
        parser_["UnaryPrefix"] = token;

        parser_.enable_packrat_parsing();
    }
};

// ============================================================================
// ExpressionParser Public Interface
// ============================================================================

ExpressionParser::ExpressionParser() : pImpl(std::make_unique<Impl>()) {}
ExpressionParser::~ExpressionParser() = default;

ParseResult ExpressionParser::parse(const std::string& text) const {
    return pImpl->parse(text);
}

ExprPtr ExpressionParser::parseOrThrow(const std::string& text) const {
    ParseResult result = pImpl->parse(text);
    if (!result.success) {
        throw ExpressionSyntaxError("invalid expression `" + text + "`: " + result.errorMessage);
    }
    return result.expression;
}

bool ExpressionParser::isGrammarValid() const {
    return pImpl->isGrammarValid();
}

std::string ExpressionParser::getLastError() const {
    return pImpl->getLastError();
}

// ============================================================================
// Utility Functions
// ============================================================================

std::optional<std::string> readFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static void addName(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

void collectNames(const ExprPtr& expr, std::vector<std::string>& names) {
    if (!expr) return;

    if (expr->is<Name>()) {
        addName(names, expr->as<Name>().name);
    } else if (expr->is<ListLiteral>()) {
        for (const auto& item : expr->as<ListLiteral>().items) collectNames(item, names);
    } else if (expr->is<ArrayLiteral>()) {
        for (const auto& row : expr->as<ArrayLiteral>().rows) {
            for (const auto& item : row) collectNames(item, names);
        }
    } else if (expr->is<UnaryOp>()) {
        collectNames(expr->as<UnaryOp>().operand, names);
    } else if (expr->is<BinaryOp>()) {
        const auto& op = expr->as<BinaryOp>();
        collectNames(op.left, names);
        collectNames(op.right, names);
    } else if (expr->is<FunctionCall>()) {
        for (const auto& arg : expr->as<FunctionCall>().args) collectNames(arg, names);
    } else if (expr->is<Subscript>()) {
        const auto& sub = expr->as<Subscript>();
        collectNames(sub.target, names);
        for (const auto& item : sub.items) {
            collectNames(item.index, names);
            collectNames(item.start, names);
            collectNames(item.stop, names);
            collectNames(item.step, names);
        }
    } else if (expr->is<Transpose>()) {
        collectNames(expr->as<Transpose>().operand, names);
    }
}

static std::string joinExpressions(const std::vector<ExprPtr>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += astToString(items[i]);
    }
    return out;
}

static std::string numberToString(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string astToString(const ExprPtr& expr) {
    if (!expr) return "";

    if (expr->is<NumberLiteral>()) {
        return numberToString(expr->as<NumberLiteral>().value);
    } else if (expr->is<StringLiteral>()) {
        return "'" + expr->as<StringLiteral>().value + "'";
    } else if (expr->is<BooleanLiteral>()) {
        return expr->as<BooleanLiteral>().value ? "true" : "false";
    } else if (expr->is<NoneLiteral>()) {
        return "None";
    } else if (expr->is<Name>()) {
        return expr->as<Name>().name;
    } else if (expr->is<ListLiteral>()) {
        return "[" + joinExpressions(expr->as<ListLiteral>().items, ", ") + "]";
    } else if (expr->is<ArrayLiteral>()) {
        const auto& array = expr->as<ArrayLiteral>();
        std::string out = array.nested ? "[" : "$[";
        for (size_t r = 0; r < array.rows.size(); ++r) {
            if (r > 0) out += "; ";
            out += joinExpressions(array.rows[r], " ");
        }
        return out + "]";
    } else if (expr->is<RangeLiteral>()) {
        const auto& range = expr->as<RangeLiteral>();
        return numberToString(range.start) + ":" + numberToString(range.step) + ":" +
               numberToString(range.stop);
    } else if (expr->is<UnaryOp>()) {
        const auto& op = expr->as<UnaryOp>();
        return "(" + op.op + astToString(op.operand) + ")";
    } else if (expr->is<BinaryOp>()) {
        const auto& op = expr->as<BinaryOp>();
        return "(" + astToString(op.left) + " " + op.op + " " + astToString(op.right) + ")";
    } else if (expr->is<FunctionCall>()) {
        const auto& call = expr->as<FunctionCall>();
        return call.name + "(" + joinExpressions(call.args, ", ") + ")";
    } else if (expr->is<Subscript>()) {
        const auto& sub = expr->as<Subscript>();
        std::string out = astToString(sub.target) + "[";
        for (size_t i = 0; i < sub.items.size(); ++i) {
            if (i > 0) out += ", ";
            const auto& item = sub.items[i];
            if (item.isSlice) {
                out += astToString(item.start) + ":" + astToString(item.stop);
                if (item.step) out += ":" + astToString(item.step);
            } else {
                out += astToString(item.index);
            }
        }
        return out + "]";
    } else if (expr->is<Transpose>()) {
        return astToString(expr->as<Transpose>().operand) + ".T";
    }

    return "?";
}

}  // namespace paramscript
