// File: JsonText.cpp

#include "JsonText.hpp"

#include "json.hpp"

#include <cstddef>

namespace IncidentFetching {

    namespace {
        constexpr int kMaxNesting = 256;

        bool isHex(char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        bool isDigit(char c) { return c >= '0' && c <= '9'; }

        // Recursive-descent recogniser over [pos_, text_.size()); no values are built.
        class JsonScanner {
        public:
            explicit JsonScanner(const std::string& text) : text_(text) {}

            bool scanDocument() {
                skipSpace();
                if (!scanValue(0)) return false;
                skipSpace();
                return pos_ == text_.size();
            }

        private:
            bool atEnd() const { return pos_ >= text_.size(); }
            char peek() const { return text_[pos_]; }

            void skipSpace() {
                while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) ++pos_;
            }

            bool consume(char expected) {
                if (atEnd() || peek() != expected) return false;
                ++pos_;
                return true;
            }

            bool scanLiteral(const char* word) {
                for (const char* c = word; *c; ++c) {
                    if (!consume(*c)) return false;
                }
                return true;
            }

            bool scanValue(int depth) {
                if (atEnd() || depth > kMaxNesting) return false;
                switch (peek()) {
                case '{': return scanObject(depth + 1);
                case '[': return scanArray(depth + 1);
                case '"': return scanString();
                case 't': return scanLiteral("true");
                case 'f': return scanLiteral("false");
                case 'n': return scanLiteral("null");
                default: return scanNumber();
                }
            }

            bool scanObject(int depth) {
                ++pos_; // '{'
                skipSpace();
                if (consume('}')) return true;
                while (true) {
                    skipSpace();
                    if (atEnd() || peek() != '"' || !scanString()) return false;
                    skipSpace();
                    if (!consume(':')) return false;
                    skipSpace();
                    if (!scanValue(depth)) return false;
                    skipSpace();
                    if (consume('}')) return true;
                    if (!consume(',')) return false;
                }
            }

            bool scanArray(int depth) {
                ++pos_; // '['
                skipSpace();
                if (consume(']')) return true;
                while (true) {
                    skipSpace();
                    if (!scanValue(depth)) return false;
                    skipSpace();
                    if (consume(']')) return true;
                    if (!consume(',')) return false;
                }
            }

            bool scanString() {
                ++pos_; // opening quote
                while (!atEnd()) {
                    char c = text_[pos_++];
                    if (c == '"') return true;
                    if (static_cast<unsigned char>(c) < 0x20) return false;
                    if (c != '\\') continue;
                    if (atEnd()) return false;
                    char escape = text_[pos_++];
                    switch (escape) {
                    case '"': case '\\': case '/': case 'b': case 'f': case 'n': case 'r': case 't':
                        break;
                    case 'u':
                        for (int i = 0; i < 4; ++i) {
                            if (atEnd() || !isHex(text_[pos_++])) return false;
                        }
                        break;
                    default:
                        return false;
                    }
                }
                return false; // unterminated
            }

            bool scanDigits() {
                std::size_t start = pos_;
                while (!atEnd() && isDigit(peek())) ++pos_;
                return pos_ > start;
            }

            bool scanNumber() {
                consume('-');
                if (consume('0')) {
                    if (!atEnd() && isDigit(peek())) return false;
                }
                else if (!scanDigits()) {
                    return false;
                }
                if (consume('.') && !scanDigits()) return false;
                if (consume('e') || consume('E')) {
                    consume('-');
                    if (!scanDigits()) return false;
                }
                return true;
            }

            const std::string& text_;
            std::size_t pos_ = 0;
        };
    }

    bool isWellFormedJson(const std::string& text) {
        return JsonScanner(text).scanDocument();
    }

    std::string stringValue(const json::JSON& value) {
        if (value.JSONType() != json::JSON::Class::String) return "";
        const std::string escaped = value.ToString();

        std::string raw;
        raw.reserve(escaped.size());
        for (std::size_t i = 0; i < escaped.size(); ++i) {
            if (escaped[i] != '\\' || i + 1 == escaped.size()) {
                raw += escaped[i];
                continue;
            }
            char next = escaped[++i];
            switch (next) {
            case '"': raw += '"'; break;
            case '\\': raw += '\\'; break;
            case 'b': raw += '\b'; break;
            case 'f': raw += '\f'; break;
            case 'n': raw += '\n'; break;
            case 'r': raw += '\r'; break;
            case 't': raw += '\t'; break;
            default:
                raw += '\\';
                raw += next;
                break;
            }
        }
        return raw;
    }

} // namespace IncidentFetching
