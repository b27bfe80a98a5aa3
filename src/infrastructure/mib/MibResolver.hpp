#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apcups::infra {

/**
 * @brief Resolves MIB object names to numeric OIDs.
 *
 * Reads the OID assignments of an SMI module (OBJECT IDENTIFIER values and
 * the ::= { parent n } clause of OBJECT-TYPE and related macros) and
 * resolves names against the standard SMI roots (iso, internet,
 * enterprises, ...). Type definitions and macro bodies are ignored.
 */
class MibResolver {
public:
    /**
     * @brief Location of the APC PowerNet MIB on a typical system.
     */
    static constexpr const char* DEFAULT_MIB_PATH = "/usr/share/snmp/mibs/powernet381.mib";

    /**
     * @brief Where the PowerNet MIB can be downloaded from.
     */
    static constexpr const char* MIB_DOWNLOAD_URL =
        "ftp://ftp.apcc.com/apc/public/software/pnetmib/mib/381/powernet381.mib";

    MibResolver();

    /**
     * @brief Loads assignments from a MIB file.
     * @param path Path to the MIB file.
     * @return True if the file was read and parsed, false otherwise
     *         (see lastError()).
     */
    bool loadFile(const std::filesystem::path& path);

    /**
     * @brief Loads assignments from MIB text.
     * @param text Module source.
     * @throws std::runtime_error on an unterminated or malformed OID value.
     */
    void parse(std::string_view text);

    /**
     * @brief Resolves a name to a dotted numeric OID.
     * @param name Object name, e.g. "upsAdvBatteryCapacity".
     * @return The OID, or std::nullopt if the name or one of its
     *         ancestors is not defined.
     */
    [[nodiscard]] std::optional<std::string> resolve(const std::string& name) const;

    /**
     * @brief Returns the number of names defined by loaded modules.
     */
    [[nodiscard]] size_t size() const { return definitions_.size(); }

    /**
     * @brief Returns the reason the last loadFile() failed.
     */
    [[nodiscard]] const std::string& lastError() const { return lastError_; }

private:
    struct Definition {
        std::string parent;           ///< Empty for an absolute value
        std::vector<uint32_t> suffix; ///< Arcs below the parent
    };

    void define(const std::string& name, const std::vector<std::string>& value);
    std::optional<std::vector<uint32_t>> resolveArcs(const std::string& name, int depth) const;

    std::map<std::string, Definition> definitions_;
    std::map<std::string, std::vector<uint32_t>> roots_;
    std::string lastError_;
};

} // namespace apcups::infra
