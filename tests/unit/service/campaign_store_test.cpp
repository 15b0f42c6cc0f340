#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "tts/service/campaign_codec.hpp"
#include "tts/service/campaign_store.hpp"

using namespace tts::service;
using tts::foundation::CampaignId;
using tts::foundation::ErrorCode;
using tts::foundation::ErrorKind;
using tts::game::Character;
using tts::game::CharacterType;
using tts::game::CombatStatus;

namespace {

constexpr const char* kValidCampaign = R"(
id: 7
name: Sunken Crypt
version: 3
roster:
  - {id: elara, name: Elara, type: PC, max_hp: 12, current_hp: 12, conditions: [Blessed]}
  - {id: goblin, name: Goblin, type: Enemy, max_hp: 7, current_hp: 7}
combat:
  id: enc-1
  is_active: true
  round_number: 2
  current_turn_index: 1
  turn_order:
    - {character_id: elara, type: PC, initiative: 18, join_order: 0}
    - {character_id: goblin, type: Enemy, initiative: 12, join_order: 1}
  surprised: [goblin]
  defeated: []
)";

/// kValidCampaign with the first occurrence of @p from replaced by @p to.
std::string corrupt(const std::string& from, const std::string& to) {
    std::string doc = kValidCampaign;
    auto pos = doc.find(from);
    EXPECT_NE(pos, std::string::npos) << from;
    if (pos != std::string::npos) {
        doc.replace(pos, from.size(), to);
    }
    return doc;
}

void expectCorrupted(const std::string& document) {
    auto decoded = decodeCampaign(document);
    ASSERT_TRUE(decoded.hasError()) << document;
    EXPECT_EQ(decoded.error().code(), ErrorCode::AggregateCorrupted);
    EXPECT_EQ(decoded.error().kind(), ErrorKind::PersistenceFailure);
}

CampaignAggregate sampleCampaign(CampaignId id) {
    auto decoded = decodeCampaign(kValidCampaign);
    EXPECT_TRUE(decoded.hasValue());
    auto aggregate = decoded.hasValue() ? decoded.value() : CampaignAggregate{};
    aggregate.id = id;
    return aggregate;
}

}  // namespace

// ===========================================================================
// Codec
// ===========================================================================

TEST(CampaignCodecTest, DecodesValidDocument) {
    auto decoded = decodeCampaign(kValidCampaign);
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();

    const auto& aggregate = decoded.value();
    EXPECT_EQ(aggregate.id, CampaignId(7));
    EXPECT_EQ(aggregate.name, "Sunken Crypt");
    EXPECT_EQ(aggregate.version, 3u);
    ASSERT_EQ(aggregate.roster.size(), 2u);
    EXPECT_EQ(aggregate.roster[0].conditions, std::vector<std::string>{"Blessed"});
    EXPECT_EQ(aggregate.roster[1].type, CharacterType::Enemy);

    ASSERT_TRUE(aggregate.combat.has_value());
    EXPECT_EQ(aggregate.combat->roundNumber, 2);
    EXPECT_EQ(aggregate.combat->currentTurnIndex, 1u);
    EXPECT_TRUE(aggregate.combat->isSurprised("goblin"));
    EXPECT_EQ(aggregate.combat->nextJoinOrder, 2u);
}

TEST(CampaignCodecTest, EncodedDocumentDecodesToSameState) {
    auto original = sampleCampaign(CampaignId(7));
    original.roster[0].deathSaveFailures = 0;
    original.roster[0].playerId = "user-42";
    original.roster[0].playerName = "Robin";

    auto decoded = decodeCampaign(encodeCampaign(original));
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();

    const auto& copy = decoded.value();
    EXPECT_EQ(copy.version, original.version);
    ASSERT_EQ(copy.roster.size(), original.roster.size());
    EXPECT_EQ(copy.roster[0].playerId, std::optional<std::string>("user-42"));
    EXPECT_EQ(copy.roster[0].playerName, std::optional<std::string>("Robin"));
    ASSERT_TRUE(copy.combat.has_value());
    EXPECT_EQ(copy.combat->turnOrder.size(), 2u);
    EXPECT_EQ(copy.combat->turnOrder[1].characterId, "goblin");
    EXPECT_EQ(copy.combat->currentTurnIndex, original.combat->currentTurnIndex);
}

TEST(CampaignCodecTest, CampaignWithoutCombat) {
    auto decoded = decodeCampaign("id: 3\nroster: []\n");
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_FALSE(decoded.value().combat.has_value());
    EXPECT_TRUE(decoded.value().roster.empty());
}

TEST(CampaignCodecTest, RejectsHpAboveMax) {
    expectCorrupted(corrupt("max_hp: 12, current_hp: 12", "max_hp: 12, current_hp: 13"));
}

TEST(CampaignCodecTest, RejectsNegativeHp) {
    expectCorrupted(corrupt("max_hp: 7, current_hp: 7", "max_hp: 7, current_hp: -1"));
}

TEST(CampaignCodecTest, RejectsDeathSaveCountAboveThree) {
    expectCorrupted(corrupt("current_hp: 12,", "current_hp: 12, death_save_failures: 4,"));
}

TEST(CampaignCodecTest, RejectsUnknownCharacterType) {
    expectCorrupted(corrupt("type: Enemy, max_hp", "type: Monster, max_hp"));
}

TEST(CampaignCodecTest, RejectsDuplicateRosterIds) {
    expectCorrupted(corrupt("{id: goblin, name: Goblin", "{id: elara, name: Goblin"));
}

TEST(CampaignCodecTest, RejectsTurnSlotWithoutRosterEntry) {
    expectCorrupted(corrupt("{character_id: goblin", "{character_id: ogre"));
}

TEST(CampaignCodecTest, RejectsRepeatedTurnSlot) {
    expectCorrupted(corrupt("{character_id: goblin", "{character_id: elara"));
}

TEST(CampaignCodecTest, RejectsTurnIndexOutOfRange) {
    expectCorrupted(corrupt("current_turn_index: 1", "current_turn_index: 2"));
}

TEST(CampaignCodecTest, RejectsMissingTurnIndex) {
    expectCorrupted(corrupt("  current_turn_index: 1\n", ""));
}

TEST(CampaignCodecTest, RejectsRoundZero) {
    expectCorrupted(corrupt("round_number: 2", "round_number: 0"));
}

TEST(CampaignCodecTest, RejectsMistypedField) {
    expectCorrupted(corrupt("max_hp: 12", "max_hp: lots"));
}

TEST(CampaignCodecTest, RejectsMissingRequiredField) {
    expectCorrupted("name: no id here\n");
}

TEST(CampaignCodecTest, RejectsNonMapAndBrokenYaml) {
    expectCorrupted("- just\n- a list\n");
    expectCorrupted("id: [7\n");
}

TEST(CampaignCodecTest, RosterNameDefaultsToId) {
    auto node = YAML::Load("[{id: mira, type: NPC, max_hp: 9, current_hp: 4}]");
    auto roster = decodeRoster(node);
    ASSERT_TRUE(roster.hasValue());
    ASSERT_EQ(roster.value().size(), 1u);
    EXPECT_EQ(roster.value()[0].name, "mira");
    EXPECT_EQ(roster.value()[0].type, CharacterType::NPC);
}

TEST(CampaignCodecTest, EventRendersOnOneLine) {
    ChangeEvent event;
    event.kind = EventKind::NarrativeAnchor;
    event.campaignId = CampaignId(7);
    event.sequence = 12;
    event.payload = NarrativeAnchorPayload{"The bridge is collapsing", "Urgency"};

    auto text = encodeEvent(event);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_NE(text.find("NarrativeAnchorUpdated"), std::string::npos);
    EXPECT_NE(text.find("sequence: 12"), std::string::npos);
    EXPECT_NE(text.find("mood_category: Urgency"), std::string::npos);

    auto parsed = YAML::Load(text);
    EXPECT_EQ(parsed["payload"]["short_text"].as<std::string>(), "The bridge is collapsing");
}

TEST(CampaignCodecTest, CombatStateListsDefeated) {
    CombatStatePayload state;
    state.combatId = "enc-1";
    state.isActive = true;
    CombatantView elara;
    elara.id = "elara";
    elara.name = "Elara";
    state.turnOrder.push_back(elara);
    CombatantView goblin;
    goblin.id = "goblin";
    goblin.name = "Goblin";
    goblin.type = CharacterType::Enemy;
    goblin.status = CombatStatus::Defeated;
    state.defeated.push_back(goblin);

    auto node = encodeCombatState(state);
    ASSERT_EQ(node["turn_order"].size(), 1u);
    ASSERT_EQ(node["defeated"].size(), 1u);
    EXPECT_EQ(node["defeated"][0]["id"].as<std::string>(), "goblin");
    EXPECT_EQ(node["defeated"][0]["status"].as<std::string>(), "Defeated");
    EXPECT_FALSE(node["turn_order"][0]["is_defeated"]);
}

TEST(CampaignCodecTest, PlayerRollEvent) {
    ChangeEvent event;
    event.kind = EventKind::PlayerRollLogged;
    event.campaignId = CampaignId(7);
    event.sequence = 3;
    event.payload = PlayerRollPayload{"elara", "Elara", "Perception", 14, std::nullopt};

    auto parsed = YAML::Load(encodeEvent(event));
    EXPECT_EQ(parsed["event"].as<std::string>(), "PlayerRollLogged");
    EXPECT_EQ(parsed["payload"]["check_type"].as<std::string>(), "Perception");
    EXPECT_EQ(parsed["payload"]["result"].as<int>(), 14);
    EXPECT_FALSE(parsed["payload"]["outcome"]);
}

// ===========================================================================
// InMemoryCampaignStore
// ===========================================================================

TEST(InMemoryCampaignStoreTest, LoadMissingIsNotFound) {
    InMemoryCampaignStore store;
    auto loaded = store.load(CampaignId(5));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::CampaignNotFound);
    ASSERT_NE(loaded.error().context<CampaignId>(), nullptr);
    EXPECT_EQ(*loaded.error().context<CampaignId>(), CampaignId(5));
}

TEST(InMemoryCampaignStoreTest, SaveReplacesAndLoadCopies) {
    InMemoryCampaignStore store;
    auto aggregate = sampleCampaign(CampaignId(5));
    ASSERT_TRUE(store.save(aggregate).hasValue());
    EXPECT_TRUE(store.contains(CampaignId(5)));

    auto loaded = store.load(CampaignId(5));
    ASSERT_TRUE(loaded.hasValue());
    loaded.value().roster[0].currentHp = 1;

    auto again = store.load(CampaignId(5));
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(again.value().roster[0].currentHp, 12);
}

TEST(InMemoryCampaignStoreTest, ZeroIdRejected) {
    InMemoryCampaignStore store;
    auto saved = store.save(CampaignAggregate{});
    ASSERT_TRUE(saved.hasError());
    EXPECT_EQ(saved.error().code(), ErrorCode::PersistenceFailed);
}

// ===========================================================================
// FileCampaignStore
// ===========================================================================

class FileCampaignStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("tts_store_") + info->name());
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path tmpDir_;
};

TEST_F(FileCampaignStoreTest, OpenCreatesDirectory) {
    FileCampaignStore store(FileCampaignStoreConfig{tmpDir_ / "nested"});
    ASSERT_TRUE(store.open().hasValue());
    EXPECT_TRUE(std::filesystem::is_directory(tmpDir_ / "nested"));
    EXPECT_EQ(store.pathFor(CampaignId(9)), tmpDir_ / "nested" / "campaign_9.yaml");
}

TEST_F(FileCampaignStoreTest, SaveThenLoad) {
    FileCampaignStore store(FileCampaignStoreConfig{tmpDir_});
    ASSERT_TRUE(store.open().hasValue());

    auto aggregate = sampleCampaign(CampaignId(9));
    aggregate.version = 11;
    ASSERT_TRUE(store.save(aggregate).hasValue());

    EXPECT_TRUE(std::filesystem::exists(store.pathFor(CampaignId(9))));
    auto tmp = store.pathFor(CampaignId(9));
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));

    auto loaded = store.load(CampaignId(9));
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    EXPECT_EQ(loaded.value().version, 11u);
    EXPECT_EQ(loaded.value().roster.size(), 2u);
    ASSERT_TRUE(loaded.value().combat.has_value());
    EXPECT_EQ(loaded.value().combat->id, "enc-1");
}

TEST_F(FileCampaignStoreTest, SecondSaveReplacesFirst) {
    FileCampaignStore store(FileCampaignStoreConfig{tmpDir_});
    ASSERT_TRUE(store.open().hasValue());

    auto aggregate = sampleCampaign(CampaignId(9));
    ASSERT_TRUE(store.save(aggregate).hasValue());
    aggregate.combat.reset();
    aggregate.version = 4;
    ASSERT_TRUE(store.save(aggregate).hasValue());

    auto loaded = store.load(CampaignId(9));
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().version, 4u);
    EXPECT_FALSE(loaded.value().combat.has_value());
}

TEST_F(FileCampaignStoreTest, MissingFileIsNotFound) {
    FileCampaignStore store(FileCampaignStoreConfig{tmpDir_});
    ASSERT_TRUE(store.open().hasValue());
    auto loaded = store.load(CampaignId(1));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::CampaignNotFound);
}

TEST_F(FileCampaignStoreTest, CorruptedFileReported) {
    FileCampaignStore store(FileCampaignStoreConfig{tmpDir_});
    ASSERT_TRUE(store.open().hasValue());
    {
        std::ofstream out(store.pathFor(CampaignId(2)));
        out << corrupt("current_turn_index: 1", "current_turn_index: 9");
    }
    auto loaded = store.load(CampaignId(2));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::AggregateCorrupted);
}

TEST_F(FileCampaignStoreTest, FileHoldingOtherCampaignReported) {
    FileCampaignStore store(FileCampaignStoreConfig{tmpDir_});
    ASSERT_TRUE(store.open().hasValue());
    {
        // Document says id 7 but sits where campaign 4 belongs.
        std::ofstream out(store.pathFor(CampaignId(4)));
        out << kValidCampaign;
    }
    auto loaded = store.load(CampaignId(4));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::AggregateCorrupted);
}
