#include "input_scanner.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <optional>

namespace {

bool is_ident_start(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool is_string_prefix(const std::string& ident) {
    if (ident.size() > 2) return false;
    for (char c : ident) {
        switch (std::tolower(static_cast<unsigned char>(c))) {
            case 'r': case 'u': case 'b': case 'f': break;
            default: return false;
        }
    }
    return true;
}

struct StringLiteral {
    std::string value;
    bool plain_str = true;   // false for f-strings and bytes
};

class PyScanner {
public:
    explicit PyScanner(const std::string& src) : src_(src) {}

    std::vector<ScriptInput> run() {
        std::vector<ScriptInput> inputs;
        char prev_sig = 0;       // last significant character outside strings/comments
        std::string prev_ident;  // "def input(...)" is a definition, not a call

        while (pos_ < src_.size()) {
            char c = src_[pos_];

            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
                continue;
            }
            if (c == '"' || c == '\'') {
                read_string("");
                prev_sig = '"';
                continue;
            }
            if (is_ident_start(c)) {
                size_t start = pos_;
                while (pos_ < src_.size() && is_ident_char(src_[pos_])) ++pos_;
                std::string ident = src_.substr(start, pos_ - start);

                if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') &&
                    is_string_prefix(ident)) {
                    read_string(ident);
                    prev_sig = '"';
                    continue;
                }

                if (ident == "input" && prev_sig != '.' && prev_ident != "def") {
                    size_t save = pos_;
                    skip_ws();
                    if (pos_ < src_.size() && src_[pos_] == '(') {
                        ++pos_;
                        ++depth_;
                        ScriptInput in;
                        in.index = static_cast<int>(inputs.size()) + 1;
                        in.prompt = literal_argument();
                        inputs.push_back(in);
                        prev_sig = '(';
                        prev_ident.clear();
                        continue;
                    }
                    pos_ = save;
                }
                prev_sig = 'a';
                prev_ident = ident;
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++depth_;
            } else if (c == ')' || c == ']' || c == '}') {
                if (depth_ == 0) broken_ = true;
                else --depth_;
            }
            if (!std::isspace(static_cast<unsigned char>(c))) prev_sig = c;
            ++pos_;
        }
        // Source that cannot compile asks for nothing
        if (broken_ || depth_ != 0) return {};
        return inputs;
    }

private:
    void skip_ws() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '\\' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
                pos_ += 2;
            } else if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    // pos_ at the opening quote.
    StringLiteral read_string(const std::string& prefix) {
        StringLiteral lit;
        bool raw = false;
        for (char p : prefix) {
            char l = static_cast<char>(std::tolower(static_cast<unsigned char>(p)));
            if (l == 'r') raw = true;
            if (l == 'f' || l == 'b') lit.plain_str = false;
        }

        char q = src_[pos_];
        bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == q && src_[pos_ + 2] == q;
        pos_ += triple ? 3 : 1;

        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\' && pos_ + 1 < src_.size()) {
                char n = src_[pos_ + 1];
                if (raw) {
                    lit.value += c;
                    lit.value += n;
                } else {
                    switch (n) {
                        case 'n': lit.value += '\n'; break;
                        case 't': lit.value += '\t'; break;
                        case 'r': lit.value += '\r'; break;
                        case '0': lit.value += '\0'; break;
                        case '\n': break;  // line continuation
                        case '\\': case '\'': case '"': lit.value += n; break;
                        default: lit.value += c; lit.value += n; break;
                    }
                }
                pos_ += 2;
                continue;
            }
            if (c == q) {
                if (!triple) { ++pos_; return lit; }
                if (pos_ + 2 < src_.size() && src_[pos_ + 1] == q && src_[pos_ + 2] == q) {
                    pos_ += 3;
                    return lit;
                }
            }
            if (c == '\n' && !triple) {  // unterminated
                broken_ = true;
                ++pos_;
                return lit;
            }
            lit.value += c;
            ++pos_;
        }
        broken_ = true;  // end of file inside the string
        return lit;
    }

    // After "input(": the prompt if the first argument is only string literals.
    // Leaves pos_ just past the literals so nested calls are still scanned.
    std::optional<std::string> literal_argument() {
        size_t save = pos_;
        skip_ws();

        std::string joined;
        bool plain = true;
        int count = 0;
        while (pos_ < src_.size()) {
            std::string prefix;
            size_t mark = pos_;
            while (pos_ < src_.size() && std::isalpha(static_cast<unsigned char>(src_[pos_]))) ++pos_;
            prefix = src_.substr(mark, pos_ - mark);
            if (pos_ >= src_.size() || (src_[pos_] != '"' && src_[pos_] != '\'') ||
                (!prefix.empty() && !is_string_prefix(prefix))) {
                pos_ = mark;
                break;
            }
            StringLiteral lit = read_string(prefix);
            plain = plain && lit.plain_str;
            joined += lit.value;
            ++count;
            skip_ws();
        }

        if (count > 0 && pos_ < src_.size() && (src_[pos_] == ',' || src_[pos_] == ')') && plain) {
            return joined;
        }
        if (count == 0) pos_ = save;
        return std::nullopt;
    }

    const std::string& src_;
    size_t pos_ = 0;
    int depth_ = 0;          // open brackets outside strings
    bool broken_ = false;    // unterminated string or unbalanced bracket
};

} // namespace

std::vector<ScriptInput> scan_python_inputs(const std::string& source) {
    return PyScanner(source).run();
}

std::vector<ScriptInput> scan_script_inputs(const std::filesystem::path& script) {
    if (script.extension() != ".py") return {};

    std::ifstream in(script, std::ios::binary);
    if (!in) return {};
    std::stringstream ss;
    ss << in.rdbuf();
    return scan_python_inputs(ss.str());
}
