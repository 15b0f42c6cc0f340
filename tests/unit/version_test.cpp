#include <gtest/gtest.h>

#include <string>

#include "tts/tts.hpp"

using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameResult;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(tts::Version::major, 0);
    EXPECT_EQ(tts::Version::minor, 3);
    EXPECT_EQ(tts::Version::patch, 0);
    EXPECT_STREQ(tts::Version::string, "0.3.0");
}

TEST(GameResultTest, ValueOr) {
    auto ok = GameResult<int>::ok(10);
    auto err = GameResult<int>::err(GameError(ErrorCode::NoActiveCombat, "idle"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(GameResultTest, MoveOutValue) {
    auto result = GameResult<std::string>::ok("elara");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "elara");
}

TEST(GameResultTest, BoolConversion) {
    auto ok = GameResult<bool>::ok(false);
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(ok.value());

    auto err = GameResult<void>::err(GameError(ErrorCode::PersistenceFailed, "disk full"));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(GameErrorTest, Describe) {
    GameError err(ErrorCode::CharacterIsDead, "Thorin is dead");
    EXPECT_EQ(err.describe(), "Vitality InvalidState: Thorin is dead");

    GameError missing(ErrorCode::CampaignNotFound, "no campaign 3");
    EXPECT_EQ(missing.describe(), "Campaign NotFound: no campaign 3");
}
