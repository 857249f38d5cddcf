#include "expression_layout.hh"

namespace snapfix::layout {

namespace {

    constexpr const char* kIndent = "    ";

    std::string multiline_block(const std::string& open,
                                const std::vector<std::string>& items,
                                const std::string& close) {
        std::string text = open + "\n";
        for (std::size_t i = 0; i < items.size(); ++i) {
            text += indent_lines(items[i]);
            if (i + 1 < items.size()) {
                text += ",";
            }
            text += "\n";
        }
        text += close;
        return text;
    }

} // anonymous namespace

bool is_multiline(const std::string& text) {
    return text.find('\n') != std::string::npos;
}

std::string indent_lines(const std::string& text) {
    std::string result = kIndent;
    for (char c : text) {
        result += c;
        if (c == '\n') {
            result += kIndent;
        }
    }
    return result;
}

std::string list(const std::string& open,
                 const std::vector<std::string>& items,
                 const std::string& close) {
    if (items.empty()) {
        return open + close;
    }
    if (items.size() == 1) {
        return open + items.front() + close;
    }
    return multiline_block(open, items, close);
}

std::string call(const std::string& callee, const std::vector<std::string>& arguments) {
    if (arguments.empty()) {
        return callee + "()";
    }

    bool single_line = true;
    std::size_t width = callee.size() + 2;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (is_multiline(arguments[i])) {
            single_line = false;
            break;
        }
        width += arguments[i].size() + (i > 0 ? 2 : 0);
    }

    if (single_line && width <= kInlineCallWidth) {
        std::string text = callee + "(";
        for (std::size_t i = 0; i < arguments.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            text += arguments[i];
        }
        text += ")";
        return text;
    }

    return multiline_block(callee + "(", arguments, ")");
}

std::string argument(const std::string* label, const std::string& expr) {
    if (label == nullptr) {
        return expr;
    }
    return *label + ": " + expr;
}

} // namespace snapfix::layout
