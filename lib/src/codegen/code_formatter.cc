//
// Code Formatter Implementation
//

#include <snapfix/codegen/code_formatter.hh>
#include <snapfix/errors.hh>

#include <vector>

namespace snapfix::codegen {

namespace {

    /// One source line after scanning
    struct ScannedLine {
        std::string content;        ///< Text without leading indentation
        std::size_t level = 0;      ///< Nesting level the line is indented to
        std::size_t code_end = 0;   ///< End of code in content (start of a trailing comment)
        bool blank = false;
        bool comment_only = false;
    };

    /// Brackets opened on the same source line share one indentation level
    struct LevelGroup {
        std::size_t line;
        std::size_t open_count;
    };

    bool is_opener(char c) {
        return c == '(' || c == '[' || c == '{';
    }

    bool is_closer(char c) {
        return c == ')' || c == ']' || c == '}';
    }

    char matching_opener(char closer) {
        switch (closer) {
            case ')': return '(';
            case ']': return '[';
            default:  return '{';
        }
    }

    bool is_horizontal_space(char c) {
        return c == ' ' || c == '\t';
    }

    std::string normalize_newlines(const std::string& text) {
        std::string result;
        result.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r') {
                result += '\n';
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
            } else {
                result += text[i];
            }
        }
        return result;
    }

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (true) {
            const std::size_t end = text.find('\n', start);
            if (end == std::string::npos) {
                lines.push_back(text.substr(start));
                break;
            }
            lines.push_back(text.substr(start, end - start));
            start = end + 1;
        }
        return lines;
    }

    std::string trim_right(const std::string& line) {
        std::size_t end = line.size();
        while (end > 0 && is_horizontal_space(line[end - 1])) {
            --end;
        }
        return line.substr(0, end);
    }

    std::string trim_left(const std::string& line) {
        std::size_t start = 0;
        while (start < line.size() && is_horizontal_space(line[start])) {
            ++start;
        }
        return line.substr(start);
    }

    class BracketTracker {
    public:
        void open(char bracket, std::size_t line) {
            brackets_.push_back(bracket);
            if (!groups_.empty() && groups_.back().line == line) {
                groups_.back().open_count++;
            } else {
                groups_.push_back({line, 1});
            }
        }

        void close(char bracket, std::size_t line) {
            if (brackets_.empty() || brackets_.back() != matching_opener(bracket)) {
                throw formatting_error("unbalanced '" + std::string(1, bracket) +
                                       "' at line " + std::to_string(line + 1));
            }
            brackets_.pop_back();
            if (--groups_.back().open_count == 0) {
                groups_.pop_back();
            }
        }

        std::size_t level() const { return groups_.size(); }
        bool balanced() const { return brackets_.empty(); }

    private:
        std::vector<char> brackets_;
        std::vector<LevelGroup> groups_;
    };

    ScannedLine scan_line(const std::string& raw, std::size_t line_number, BracketTracker& tracker) {
        ScannedLine line;
        line.content = trim_left(raw);
        line.blank = line.content.empty();
        line.code_end = trim_right(line.content).size();

        if (line.blank) {
            line.level = tracker.level();
            return line;
        }

        const std::string& text = line.content;
        std::size_t pos = 0;

        // Leading closers dedent their own line
        while (pos < text.size() && (is_closer(text[pos]) || is_horizontal_space(text[pos]))) {
            if (is_closer(text[pos])) {
                tracker.close(text[pos], line_number);
            }
            ++pos;
        }
        line.level = tracker.level();

        bool in_string = false;
        for (; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (in_string) {
                if (c == '\\') {
                    ++pos;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            if (c == '"') {
                in_string = true;
            } else if (c == '/' && pos + 1 < text.size() && text[pos + 1] == '/') {
                line.code_end = trim_right(text.substr(0, pos)).size();
                line.comment_only = line.code_end == 0;
                break;
            } else if (is_opener(c)) {
                tracker.open(c, line_number);
            } else if (is_closer(c)) {
                tracker.close(c, line_number);
            }
        }

        if (in_string) {
            throw formatting_error("unterminated string literal at line " +
                                   std::to_string(line_number + 1));
        }
        return line;
    }

    bool ends_list_element(const ScannedLine& line) {
        if (line.blank || line.comment_only || line.code_end == 0) {
            return false;
        }
        const char last = line.content[line.code_end - 1];
        return !is_opener(last) && last != ',';
    }

    bool starts_with_list_closer(const ScannedLine& line) {
        return !line.blank && (line.content[0] == ']' || line.content[0] == ')');
    }

} // anonymous namespace

std::string CodeFormatter::format(const std::string& text, const FormatProfile& profile) {
    std::vector<std::string> raw_lines = split_lines(normalize_newlines(text));

    if (profile.trim_trailing_whitespace) {
        for (auto& line : raw_lines) {
            line = trim_right(line);
        }
    }

    BracketTracker tracker;
    std::vector<ScannedLine> lines;
    lines.reserve(raw_lines.size());
    for (std::size_t i = 0; i < raw_lines.size(); ++i) {
        lines.push_back(scan_line(raw_lines[i], i, tracker));
    }
    if (!tracker.balanced()) {
        throw formatting_error("unclosed bracket at end of input");
    }

    // Trailing comma after the last element of multi-line lists
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!ends_list_element(lines[i])) {
            continue;
        }
        std::size_t next = i + 1;
        while (next < lines.size() && lines[next].blank) {
            ++next;
        }
        if (next < lines.size() && starts_with_list_closer(lines[next])) {
            lines[i].content.insert(lines[i].code_end, ",");
        }
    }

    const std::string unit = profile.indent_unit();
    std::string result;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const ScannedLine& line = lines[i];
        if (i > 0) {
            result += '\n';
        }
        if (line.blank) {
            // Whitespace-only lines survive only when trimming is off
            result += raw_lines[i];
            continue;
        }
        for (std::size_t level = 0; level < line.level; ++level) {
            result += unit;
        }
        result += line.content;
    }

    // Exactly one final newline, or none
    while (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }
    if (profile.insert_final_newline) {
        result += '\n';
    }

    if (profile.line_ending == LineEnding::CRLF) {
        std::string converted;
        converted.reserve(result.size() + result.size() / 16);
        for (char c : result) {
            if (c == '\n') {
                converted += '\r';
            }
            converted += c;
        }
        return converted;
    }
    return result;
}

} // namespace snapfix::codegen
