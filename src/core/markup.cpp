#include "markup.hpp"
#include <map>
#include <sstream>
#include <vector>

namespace markup {

static const char* RESET = "\033[0m";

static const std::map<std::string, std::string>& styles() {
    static const std::map<std::string, std::string> table = {
        {"bold",         "\033[1m"},
        {"dim",          "\033[2m"},
        {"cyan",         "\033[36m"},
        {"green",        "\033[32m"},
        {"red",          "\033[31m"},
        {"yellow",       "\033[33m"},
        {"white",        "\033[97m"},
        {"bright_black", "\033[90m"},
        {"grey50",       "\033[38;5;244m"},
    };
    return table;
}

// "green dim" -> SGR codes. False if any word is not a style.
static bool parse_styles(const std::string& body, std::string& codes) {
    std::istringstream ss(body);
    std::string word;
    bool any = false;
    codes.clear();
    while (ss >> word) {
        auto it = styles().find(word);
        if (it == styles().end()) return false;
        codes += it->second;
        any = true;
    }
    return any;
}

static std::string render(const std::string& text, bool ansi) {
    std::string out;
    out.reserve(text.size());
    std::vector<std::string> stack;  // SGR codes of open tags

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        char c = text[i];

        if (c == '\\' && i + 1 < n && (text[i + 1] == '[' || text[i + 1] == '\\')) {
            out += text[i + 1];
            i += 2;
            continue;
        }

        if (c == '[') {
            size_t close = text.find(']', i + 1);
            if (close != std::string::npos) {
                std::string body = text.substr(i + 1, close - i - 1);
                std::string codes;

                if (!body.empty() && body[0] == '/') {
                    std::string rest = body.substr(1);
                    bool valid_close = rest.find_first_not_of(' ') == std::string::npos
                                       || parse_styles(rest, codes);
                    if (valid_close && !stack.empty()) {
                        stack.pop_back();
                        if (ansi) {
                            out += RESET;
                            for (const auto& s : stack) out += s;
                        }
                        i = close + 1;
                        continue;
                    }
                } else if (parse_styles(body, codes)) {
                    stack.push_back(codes);
                    if (ansi) out += codes;
                    i = close + 1;
                    continue;
                }
            }
        }

        out += c;
        i++;
    }

    if (ansi && !stack.empty()) out += RESET;
    return out;
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '[' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string to_ansi(const std::string& text) {
    return render(text, true);
}

std::string strip(const std::string& text) {
    return render(text, false);
}

} // namespace markup
