#include <catch2/catch_test_macros.hpp>

#include "infrastructure/storage/HostFileStore.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mping::core;
using namespace mping::infra;

namespace {

class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("mping_store_" + std::to_string(counter_++) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary);
    file << contents;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("HostFileStore parsing", "[HostFileStore]") {
    SECTION("Address and description") {
        auto hosts = HostFileStore::parse("10.0.0.1,Router\nexample.com,Web server\n");
        REQUIRE(hosts.size() == 2);
        REQUIRE(hosts[0] == Host{"10.0.0.1", "Router"});
        REQUIRE(hosts[1] == Host{"example.com", "Web server"});
    }

    SECTION("Split happens at the first comma") {
        auto hosts = HostFileStore::parse("db.local,Primary, rack 4");
        REQUIRE(hosts.size() == 1);
        REQUIRE(hosts[0].description == "Primary, rack 4");
    }

    SECTION("Fields are trimmed") {
        auto hosts = HostFileStore::parse("  10.0.0.2 ,  Switch  \r\n");
        REQUIRE(hosts[0] == Host{"10.0.0.2", "Switch"});
    }

    SECTION("Missing description") {
        auto hosts = HostFileStore::parse("10.0.0.3\n10.0.0.4,\n");
        REQUIRE(hosts.size() == 2);
        REQUIRE(hosts[0].description.empty());
        REQUIRE(hosts[1].description.empty());
    }

    SECTION("Blank lines and empty addresses are skipped") {
        auto hosts = HostFileStore::parse("\n   \n,orphan description\n10.0.0.5\n\n");
        REQUIRE(hosts.size() == 1);
        REQUIRE(hosts[0].address == "10.0.0.5");
    }

    SECTION("Duplicates are kept") {
        auto hosts = HostFileStore::parse("a.example\na.example,again");
        REQUIRE(hosts.size() == 2);
    }
}

TEST_CASE("HostFileStore formatting", "[HostFileStore]") {
    std::vector<Host> hosts{{"10.0.0.1", "Router"}, {"10.0.0.2", ""}, {"db", "a, b"}};
    REQUIRE(HostFileStore::format(hosts) == "10.0.0.1,Router\n10.0.0.2\ndb,a, b");
    REQUIRE(HostFileStore::format({}).empty());
}

TEST_CASE("HostFileStore loading", "[HostFileStore]") {
    TempDir dir;

    SECTION("Missing file yields an empty list") {
        HostFileStore store(dir.file("absent.txt"));
        REQUIRE(store.load().empty());
    }

    SECTION("Hosts come back sorted by name") {
        writeFile(dir.file("hosts.txt"), "b.example,Second\nA.example,First\nc.example");
        HostFileStore store(dir.file("hosts.txt"));

        auto hosts = store.load();
        REQUIRE(hosts.size() == 3);
        REQUIRE(hosts[0].address == "A.example");
        REQUIRE(hosts[1].address == "b.example");
        REQUIRE(hosts[2].address == "c.example");
    }

    SECTION("A directory in place of the file is an error") {
        std::filesystem::create_directories(dir.file("hosts.txt"));
        HostFileStore store(dir.file("hosts.txt"));
        REQUIRE_THROWS_AS(store.load(), std::runtime_error);
    }
}

TEST_CASE("HostFileStore saving", "[HostFileStore]") {
    TempDir dir;
    HostFileStore store(dir.file("hosts.txt"));

    SECTION("Contents match the file format") {
        store.save({{"z.example", "Last"}, {"a.example", ""}});
        REQUIRE(readFile(dir.file("hosts.txt")) == "z.example,Last\na.example");
        REQUIRE_FALSE(std::filesystem::exists(dir.file("hosts.txt.tmp")));
    }

    SECTION("Saved hosts load back") {
        std::vector<Host> hosts{{"a.example", "Alpha, first"}, {"b.example", "Beta"}};
        store.save(hosts);
        REQUIRE(store.load() == hosts);
    }

    SECTION("Saving replaces the previous contents") {
        writeFile(dir.file("hosts.txt"), "old.example,Old\nolder.example");
        store.save({{"new.example", ""}});
        REQUIRE(readFile(dir.file("hosts.txt")) == "new.example");
    }

    SECTION("Unwritable location throws") {
        HostFileStore broken(dir.file("missing-dir") / "hosts.txt");
        REQUIRE_THROWS_AS(broken.save({{"a.example", ""}}), std::runtime_error);
    }
}
