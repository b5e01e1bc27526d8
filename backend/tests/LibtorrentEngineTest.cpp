#include "engine/LibtorrentEngine.hpp"

#include "TestSupport.hpp"

#include <libtorrent/settings_pack.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <doctest/doctest.h>

using rt::engine::LibtorrentEngine;

namespace
{

rt::engine::EngineSettings make_settings()
{
    rt::engine::EngineSettings settings;
    settings.download_path =
        (std::filesystem::temp_directory_path() / "reeltest-lt").string();
    settings.listen_interface = "127.0.0.1:0";
    settings.dht_enabled = false;
    settings.lsd_enabled = false;
    return settings;
}

} // namespace

TEST_CASE("LibtorrentEngine derives content ids from magnets and hashes")
{
    LibtorrentEngine engine(make_settings());
    auto const hash = rt::test::kHashA;

    auto from_magnet = engine.content_id(rt::test::magnet_for(hash));
    REQUIRE(from_magnet);
    CHECK(*from_magnet == hash);

    std::string upper = "0123456789ABCDEF0123456789ABCDEF01234567";
    auto from_hex = engine.content_id(upper);
    REQUIRE(from_hex);
    CHECK(*from_hex == hash);
}

TEST_CASE("LibtorrentEngine rejects locators it cannot parse")
{
    LibtorrentEngine engine(make_settings());
    CHECK_FALSE(engine.content_id(""));
    CHECK_FALSE(engine.content_id("magnet:?dn=no-hash"));
    CHECK_FALSE(engine.content_id("0123456789abcdef"));
    CHECK_FALSE(engine.content_id("zz23456789abcdef0123456789abcdef01234567"));
    CHECK_FALSE(engine.content_id("0000000000000000000000000000000000000000"));
    CHECK_FALSE(engine.content_id("/nonexistent/file.torrent"));

    auto root = rt::test::make_temp_root("lt-bad-metainfo");
    auto bogus = root / "broken.torrent";
    {
        std::ofstream out(bogus, std::ios::binary);
        out << "this is not bencoded";
    }
    CHECK_FALSE(engine.content_id(bogus.string()));
    CHECK_THROWS_AS(engine.start_transfer(bogus.string()),
                    rt::engine::InvalidLocatorError);

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("LibtorrentEngine refuses transfers before it is started")
{
    LibtorrentEngine engine(make_settings());
    CHECK_THROWS_AS(engine.start_transfer("not a locator"),
                    rt::engine::InvalidLocatorError);
    CHECK_THROWS_AS(engine.start_transfer(rt::test::magnet_for(rt::test::kHashA)),
                    std::runtime_error);
    CHECK_FALSE(engine.lookup(rt::test::kHashA));
    engine.pump();
}

TEST_CASE("LibtorrentEngine builds its session settings from EngineSettings")
{
    auto settings = make_settings();
    auto pack = LibtorrentEngine::build_settings_pack(settings);
    CHECK(pack.get_str(libtorrent::settings_pack::listen_interfaces) ==
          "127.0.0.1:0");
    CHECK_FALSE(pack.get_bool(libtorrent::settings_pack::enable_dht));
    CHECK_FALSE(pack.get_bool(libtorrent::settings_pack::enable_lsd));
    CHECK(pack.get_str(libtorrent::settings_pack::user_agent).find("ReelTorrent") !=
          std::string::npos);
}
