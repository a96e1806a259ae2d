#pragma once

#include <string>
#include <set>
#include <vector>
#include <memory>

namespace execbox {

// Allow-list of opaque access tokens, loaded once at startup
class TokenStore {
public:
    explicit TokenStore(const std::vector<std::string>& tokens);

    // One token per line; surrounding whitespace and blank lines are ignored.
    // Returns nullptr if the file cannot be read.
    static std::unique_ptr<TokenStore> from_file(const std::string& path);

    bool is_valid(const std::string& token) const;

    size_t size() const { return tokens_.size(); }

private:
    std::set<std::string> tokens_;
};

} // namespace execbox
