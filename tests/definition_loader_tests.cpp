#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include "deck/app_config.h"
#include "deck/definition_loader.h"
#include "deck/deck_manager.h"
#include "deck/errors.h"

using namespace deck_sim;
using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;

namespace {

// Répertoire temporaire supprimé à la fin du test
struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("deck_sim_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        const fs::path file = path / name;
        std::ofstream out(file);
        out << content;
        return file.string();
    }
};

const char* TILES_JSON = R"({"cards":[{"name":"Grassland","count":2},{"name":"Desert","count":1}]})";
const char* EVENTS_JSON = R"({"reshuffle": true, "cards":[{"name":"Storm","count":2},{"name":"Plague","count":1}]})";

} // namespace

TEST_CASE("parse_definition_document", "[loader]") {
    SECTION("plain deck") {
        DeckDefinition def = parse_definition_document(nlohmann::json::parse(TILES_JSON));
        REQUIRE(def.table.size() == 2);
        REQUIRE(def.table.total_count() == 3);
        REQUIRE_FALSE(def.options.reshuffle);
    }
    SECTION("reshuffle flag") {
        DeckDefinition def = parse_definition_document(nlohmann::json::parse(EVENTS_JSON));
        REQUIRE(def.options.reshuffle);
        REQUIRE(def.table[0].name == "Storm");
    }
    SECTION("missing cards key") {
        REQUIRE_THROWS_WITH(parse_definition_document(nlohmann::json::parse(R"({"tiles":[]})")),
                            ContainsSubstring("'cards'"));
    }
    SECTION("not an object") {
        REQUIRE_THROWS_AS(parse_definition_document(nlohmann::json::parse(R"([{"name":"A","count":1}])")),
                          ValidationError);
    }
    SECTION("reshuffle must be a boolean") {
        REQUIRE_THROWS_AS(parse_definition_document(nlohmann::json::parse(
                              R"({"reshuffle":"yes","cards":[{"name":"A","count":1}]})")),
                          ValidationError);
    }
    SECTION("invalid cards") {
        REQUIRE_THROWS_AS(parse_definition_document(nlohmann::json::parse(R"({"cards":[]})")), ValidationError);
        REQUIRE_THROWS_AS(parse_definition_document(nlohmann::json::parse(R"({"cards":{"A":1}})")), ValidationError);
    }
}

TEST_CASE("load_definition_file", "[loader]") {
    TempDir dir;

    SECTION("valid file") {
        const std::string path = dir.write("tiles.json", TILES_JSON);
        DeckDefinition def = load_definition_file(path);
        REQUIRE(def.table.size() == 2);
        REQUIRE(deck_id_from_path(path) == "tiles");
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(load_definition_file((dir.path / "nope.json").string()), std::runtime_error);
    }
    SECTION("malformed JSON") {
        const std::string path = dir.write("broken.json", R"({"cards": [)");
        REQUIRE_THROWS_AS(load_definition_file(path), ValidationError);
        REQUIRE_THROWS_WITH(load_definition_file(path), ContainsSubstring("broken.json"));
    }
    SECTION("invalid format mentions the file") {
        const std::string path = dir.write("zero.json", R"({"cards":[{"name":"A","count":0}]})");
        REQUIRE_THROWS_WITH(load_definition_file(path), ContainsSubstring("zero.json"));
    }
}

TEST_CASE("deck_id_from_path", "[loader]") {
    REQUIRE(deck_id_from_path("data/cards.json") == "cards");
    REQUIRE(deck_id_from_path("/tmp/decks/event_deck.json") == "event_deck");
    REQUIRE(deck_id_from_path("plain") == "plain");
}

TEST_CASE("load_decks_from_directory", "[loader]") {
    TempDir dir;
    DeckManager manager;

    SECTION("loads every json file in name order") {
        dir.write("main_deck.json", TILES_JSON);
        dir.write("event_deck.json", EVENTS_JSON);
        dir.write("README.txt", "not a deck");

        auto ids = load_decks_from_directory(manager, dir.path.string());
        REQUIRE(ids == std::vector<std::string>{"event_deck", "main_deck"});
        REQUIRE(manager.list_deck_ids() == ids);
        REQUIRE(manager.get_deck("event_deck").reshuffles_when_empty());
        REQUIRE_FALSE(manager.get_deck("main_deck").reshuffles_when_empty());
        REQUIRE(manager.get_deck("main_deck").total() == 3);
    }

    SECTION("one bad file leaves the manager untouched") {
        dir.write("a.json", TILES_JSON);
        dir.write("b.json", R"({"cards":[{"name":"A","count":-2}]})");
        REQUIRE_THROWS_AS(load_decks_from_directory(manager, dir.path.string()), ValidationError);
        REQUIRE(manager.empty());
    }

    SECTION("an id already registered is a DuplicateDeckError") {
        dir.write("tiles.json", TILES_JSON);
        manager.create_deck("tiles", CardTypeTable::parse(std::vector<CardTypeEntry>{{"X", 1}}));
        REQUIRE_THROWS_AS(load_decks_from_directory(manager, dir.path.string()), DuplicateDeckError);
        REQUIRE(manager.size() == 1);
        REQUIRE(manager.get_deck("tiles").table()[0].name == "X");
    }

    SECTION("no json files") {
        REQUIRE_THROWS_AS(load_decks_from_directory(manager, dir.path.string()), std::runtime_error);
    }

    SECTION("missing directory") {
        REQUIRE_THROWS_AS(load_decks_from_directory(manager, (dir.path / "missing").string()), std::runtime_error);
    }
}

TEST_CASE("load_configured_decks", "[loader]") {
    TempDir dir;
    DeckManager manager;
    AppConfig config;

    SECTION("cards file registered under its stem") {
        config.cards_file = dir.write("tiles.json", TILES_JSON);
        REQUIRE(load_configured_decks(manager, config) == std::vector<std::string>{"tiles"});
        REQUIRE(manager.list_deck_ids() == std::vector<std::string>{"tiles"});
        REQUIRE(manager.get_deck("tiles").total() == 3);
    }

    SECTION("decks directory wins over the cards file") {
        config.cards_file = (dir.path / "missing.json").string();
        fs::create_directories(dir.path / "decks");
        dir.write("decks/event_deck.json", EVENTS_JSON);
        dir.write("decks/main_deck.json", TILES_JSON);
        config.decks_directory = (dir.path / "decks").string();

        REQUIRE(load_configured_decks(manager, config) == std::vector<std::string>{"event_deck", "main_deck"});
        REQUIRE_FALSE(manager.contains("missing"));
    }

    SECTION("missing cards file") {
        config.cards_file = (dir.path / "nope.json").string();
        REQUIRE_THROWS_AS(load_configured_decks(manager, config), std::runtime_error);
        REQUIRE(manager.empty());
    }
}
