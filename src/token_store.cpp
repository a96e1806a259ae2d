#include "token_store.h"
#include "encoding.h"
#include <fstream>
#include <iostream>

namespace execbox {

TokenStore::TokenStore(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        std::string trimmed = Encoding::trim(token);
        if (!trimmed.empty()) {
            tokens_.insert(trimmed);
        }
    }
}

std::unique_ptr<TokenStore> TokenStore::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Tokens] Cannot read token file: " << path << std::endl;
        return nullptr;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    auto store = std::make_unique<TokenStore>(lines);
    std::cout << "[Tokens] Loaded " << store->size() << " tokens from " << path << std::endl;
    return store;
}

bool TokenStore::is_valid(const std::string& token) const {
    return !token.empty() && tokens_.count(token) > 0;
}

} // namespace execbox
