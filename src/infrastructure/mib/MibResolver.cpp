#include "infrastructure/mib/MibResolver.hpp"

#include "infrastructure/network/BerCodec.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace apcups::infra {

namespace {

constexpr int kMaxDepth = 64;

// Macros whose value clause is an OID assignment
const std::set<std::string, std::less<>> kOidMacros{
    "OBJECT-TYPE",       "MODULE-IDENTITY",    "OBJECT-IDENTITY", "NOTIFICATION-TYPE",
    "OBJECT-GROUP",      "NOTIFICATION-GROUP", "MODULE-COMPLIANCE", "AGENT-CAPABILITIES",
};

bool isIdentifierChar(std::string_view text, size_t i) {
    char c = text[i];
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
        return true;
    }
    // A single hyphen continues a name, a double hyphen starts a comment
    return c == '-' && i + 1 < text.size() && text[i + 1] != '-';
}

bool isNumber(const std::string& token) {
    return !token.empty() && token.find_first_not_of("0123456789") == std::string::npos;
}

bool isValueName(const std::string& token) {
    return !token.empty() && std::islower(static_cast<unsigned char>(token[0]));
}

uint32_t toArc(const std::string& token) {
    try {
        return static_cast<uint32_t>(std::stoul(token));
    } catch (const std::exception&) {
        throw std::runtime_error("OID arc out of range: " + token);
    }
}

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '-' && i + 1 < n && text[i + 1] == '-') {
            // Comment runs to end of line
            while (i < n && text[i] != '\n') ++i;
        } else if (c == '"' || c == '\'') {
            // Quoted text (DESCRIPTION, hex and binary strings) carries no OIDs
            auto close = text.find(c, i + 1);
            i = (close == std::string_view::npos) ? n : close + 1;
        } else if (text.compare(i, 3, "::=") == 0) {
            tokens.emplace_back("::=");
            i += 3;
        } else if (isIdentifierChar(text, i) && c != '-') {
            size_t start = i;
            while (i < n && isIdentifierChar(text, i)) ++i;
            tokens.emplace_back(text.substr(start, i - start));
        } else {
            tokens.emplace_back(1, c);
            ++i;
        }
    }

    return tokens;
}

} // namespace

MibResolver::MibResolver()
    : roots_{
          {"ccitt", {0}},
          {"iso", {1}},
          {"joint-iso-ccitt", {2}},
          {"org", {1, 3}},
          {"dod", {1, 3, 6}},
          {"internet", {1, 3, 6, 1}},
          {"directory", {1, 3, 6, 1, 1}},
          {"mgmt", {1, 3, 6, 1, 2}},
          {"mib-2", {1, 3, 6, 1, 2, 1}},
          {"experimental", {1, 3, 6, 1, 3}},
          {"private", {1, 3, 6, 1, 4}},
          {"enterprises", {1, 3, 6, 1, 4, 1}},
          {"security", {1, 3, 6, 1, 5}},
          {"snmpV2", {1, 3, 6, 1, 6}},
      } {}

bool MibResolver::loadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        lastError_ = "Failed to open MIB file: " + path.string();
        spdlog::error(lastError_);
        return false;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    try {
        size_t before = definitions_.size();
        parse(contents.str());
        spdlog::debug("Loaded {} MIB definitions from {}", definitions_.size() - before,
                      path.string());
        lastError_.clear();
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to parse MIB file " + path.string() + ": " + e.what();
        spdlog::error(lastError_);
        return false;
    }
}

void MibResolver::parse(std::string_view text) {
    auto tokens = tokenize(text);
    std::string current;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];

        if (token == "::=") {
            std::string name = std::exchange(current, {});
            if (name.empty() || i + 1 >= tokens.size() || tokens[i + 1] != "{") {
                continue;
            }

            size_t end = i + 2;
            while (end < tokens.size() && tokens[end] != "}") ++end;
            if (end == tokens.size()) {
                throw std::runtime_error("Unterminated OID value for " + name);
            }

            define(name, std::vector<std::string>(tokens.begin() + static_cast<long>(i) + 2,
                                                  tokens.begin() + static_cast<long>(end)));
            i = end;
            continue;
        }

        if (isValueName(token) && i + 1 < tokens.size()) {
            const auto& next = tokens[i + 1];
            if (kOidMacros.contains(next)) {
                current = token;
            } else if (next == "OBJECT" && i + 2 < tokens.size() && tokens[i + 2] == "IDENTIFIER") {
                current = token;
            }
        }
    }
}

void MibResolver::define(const std::string& name, const std::vector<std::string>& value) {
    Definition definition;

    for (size_t k = 0; k < value.size(); ++k) {
        const auto& token = value[k];

        if (isNumber(token)) {
            definition.suffix.push_back(toArc(token));
        } else if (k + 3 < value.size() && value[k + 1] == "(" && isNumber(value[k + 2]) &&
                   value[k + 3] == ")") {
            // name(number) form, e.g. { iso(1) org(3) dod(6) }
            definition.suffix.push_back(toArc(value[k + 2]));
            k += 3;
        } else if (k == 0) {
            definition.parent = token;
        } else {
            throw std::runtime_error("Unexpected token '" + token + "' in OID value for " + name);
        }
    }

    if (definition.parent.empty() && definition.suffix.empty()) {
        throw std::runtime_error("Empty OID value for " + name);
    }

    definitions_[name] = std::move(definition);
}

std::optional<std::vector<uint32_t>> MibResolver::resolveArcs(const std::string& name,
                                                              int depth) const {
    if (depth > kMaxDepth) {
        spdlog::warn("MIB definition of {} is circular or too deep", name);
        return std::nullopt;
    }

    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        auto root = roots_.find(name);
        if (root == roots_.end()) {
            return std::nullopt;
        }
        return root->second;
    }

    const auto& definition = it->second;
    std::vector<uint32_t> arcs;
    if (!definition.parent.empty()) {
        auto parent = resolveArcs(definition.parent, depth + 1);
        if (!parent) {
            return std::nullopt;
        }
        arcs = std::move(*parent);
    }
    arcs.insert(arcs.end(), definition.suffix.begin(), definition.suffix.end());
    return arcs;
}

std::optional<std::string> MibResolver::resolve(const std::string& name) const {
    auto arcs = resolveArcs(name, 0);
    if (!arcs) {
        return std::nullopt;
    }
    return BerCodec::oidVectorToString(*arcs);
}

} // namespace apcups::infra
