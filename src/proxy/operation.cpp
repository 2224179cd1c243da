/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Operation Detection Implementation
 */

#include "proxy/operation.hpp"

#include <cctype>
#include <vector>

namespace qcache::proxy {

namespace {

struct OperationDefinition {
    cache::OperationType type;
    std::optional<std::string> name;
};

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class DefinitionScanner {
public:
    explicit DefinitionScanner(std::string_view doc) : doc_(doc) {}

    std::vector<OperationDefinition> scan() {
        std::vector<OperationDefinition> definitions;
        std::optional<OperationDefinition> pending;
        bool in_fragment = false;
        int depth = 0;

        while (pos_ < doc_.size()) {
            char c = doc_[pos_];

            if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
                ++pos_;
            } else if (c == '#') {
                skip_comment();
            } else if (c == '"') {
                skip_string();
            } else if (c == '{' || c == '(' || c == '[') {
                if (depth == 0 && c == '{' && !pending && !in_fragment) {
                    // Query shorthand
                    definitions.push_back({cache::OperationType::Query, std::nullopt});
                }
                ++depth;
                ++pos_;
            } else if (c == '}' || c == ')' || c == ']') {
                if (depth > 0) {
                    --depth;
                }
                if (depth == 0 && c == '}') {
                    if (pending) {
                        definitions.push_back(std::move(*pending));
                        pending.reset();
                    }
                    in_fragment = false;
                }
                ++pos_;
            } else if (is_name_start(c)) {
                auto word = read_name();
                if (depth != 0 || pending || in_fragment) {
                    continue;
                }
                if (word == "query" || word == "mutation" || word == "subscription") {
                    OperationDefinition def{to_type(word), std::nullopt};
                    skip_ignored();
                    if (pos_ < doc_.size() && is_name_start(doc_[pos_])) {
                        def.name = std::string(read_name());
                    }
                    pending = std::move(def);
                } else if (word == "fragment") {
                    in_fragment = true;
                }
            } else {
                ++pos_;
            }
        }

        return definitions;
    }

private:
    static cache::OperationType to_type(std::string_view keyword) {
        if (keyword == "mutation") {
            return cache::OperationType::Mutation;
        }
        if (keyword == "subscription") {
            return cache::OperationType::Subscription;
        }
        return cache::OperationType::Query;
    }

    std::string_view read_name() {
        auto start = pos_;
        while (pos_ < doc_.size() && is_name_char(doc_[pos_])) {
            ++pos_;
        }
        return doc_.substr(start, pos_ - start);
    }

    void skip_comment() {
        while (pos_ < doc_.size() && doc_[pos_] != '\n') {
            ++pos_;
        }
    }

    void skip_string() {
        if (doc_.substr(pos_, 3) == "\"\"\"") {
            auto end = doc_.find("\"\"\"", pos_ + 3);
            pos_ = end == std::string_view::npos ? doc_.size() : end + 3;
            return;
        }
        ++pos_;
        while (pos_ < doc_.size() && doc_[pos_] != '"' && doc_[pos_] != '\n') {
            pos_ += doc_[pos_] == '\\' ? 2 : 1;
        }
        ++pos_;
    }

    void skip_ignored() {
        while (pos_ < doc_.size()) {
            char c = doc_[pos_];
            if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
                ++pos_;
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    std::string_view doc_;
    std::size_t pos_{0};
};

} // namespace

std::optional<cache::OperationType> detect_operation_type(std::string_view document,
                                                          const std::optional<std::string>& operation_name) {
    auto definitions = DefinitionScanner(document).scan();

    if (operation_name) {
        for (const auto& def : definitions) {
            if (def.name == operation_name) {
                return def.type;
            }
        }
        return std::nullopt;
    }

    if (definitions.size() != 1) {
        return std::nullopt;
    }
    return definitions.front().type;
}

} // namespace qcache::proxy
