#pragma once

#include "core/services/IHostStore.hpp"

#include <filesystem>

namespace mping::infra {

/**
 * @brief Host list persisted as a text file.
 *
 * One host per line in the form `address,description`. The line is split at
 * the first comma and both fields are trimmed, so descriptions may contain
 * commas. Blank lines and lines with an empty address are skipped.
 */
class HostFileStore : public core::IHostStore {
public:
    explicit HostFileStore(std::filesystem::path path);

    /**
     * @brief Reads the host file.
     * @return Hosts sorted by address; empty if the file does not exist.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    std::vector<core::Host> load() override;

    /**
     * @brief Writes the host file through a temporary file and a rename.
     * @throws std::runtime_error if the file cannot be written.
     */
    void save(const std::vector<core::Host>& hosts) override;

    /**
     * @brief Parses host file contents.
     * @return Hosts in file order.
     */
    static std::vector<core::Host> parse(const std::string& contents);

    /**
     * @brief Formats hosts as file contents, without a trailing newline.
     */
    static std::string format(const std::vector<core::Host>& hosts);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace mping::infra
