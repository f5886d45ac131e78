#include <gtest/gtest.h>
#include "core/policy_engine.hpp"
#include "logging/logger.hpp"

class PolicyEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
    }

    static MediaRecord record(MediaKind kind, const std::string &container)
    {
        MediaRecord r;
        r.relative_path = "sample";
        r.kind = kind;
        r.container = container;
        return r;
    }

    PolicySettings settings_;
};

TEST_F(PolicyEngineTest, VideoLevelsSelectSubtitlePolicy)
{
    auto remux = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "matroska"), CdrLevel::REMUX, settings_);
    ASSERT_TRUE(remux.success);
    EXPECT_EQ(remux.plan.container, "mp4");
    EXPECT_EQ(remux.plan.subtitles, SubtitlePolicy::DROP);
    EXPECT_EQ(remux.plan.video.mode, StreamMode::COPY_OR_ENCODE);
    EXPECT_EQ(remux.plan.audio.mode, StreamMode::COPY_OR_ENCODE);

    auto transcode = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "matroska"), CdrLevel::TRANSCODE, settings_);
    ASSERT_TRUE(transcode.success);
    EXPECT_EQ(transcode.plan.subtitles, SubtitlePolicy::REENCODE_TEXT);
    EXPECT_EQ(transcode.plan.video.mode, StreamMode::ENCODE);
    EXPECT_EQ(transcode.plan.video.encoder, "libx264");
    EXPECT_EQ(transcode.plan.audio.encoder, "aac");
    EXPECT_EQ(transcode.plan.audio.bitrate_kbps, settings_.video_audio_bitrate_kbps);

    auto hardcore = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "mp4"), CdrLevel::HARDCORE, settings_);
    ASSERT_TRUE(hardcore.success);
    EXPECT_EQ(hardcore.plan.subtitles, SubtitlePolicy::BURN_IN);
    EXPECT_EQ(hardcore.plan.effective_level, CdrLevel::HARDCORE);
    EXPECT_FALSE(hardcore.plan.isDegraded());
}

TEST_F(PolicyEngineTest, ImageRemuxDegradesWithNote)
{
    auto png = PolicyEngine::buildPlan(record(MediaKind::IMAGE, "png"), CdrLevel::REMUX, settings_);
    ASSERT_TRUE(png.success);
    EXPECT_EQ(png.plan.requested_level, CdrLevel::REMUX);
    EXPECT_EQ(png.plan.effective_level, CdrLevel::TRANSCODE);
    EXPECT_TRUE(png.plan.isDegraded());
    EXPECT_EQ(png.plan.container, "png");
    EXPECT_EQ(png.plan.audio.mode, StreamMode::DROP);
}

TEST_F(PolicyEngineTest, JpegRemuxStaysJpeg)
{
    auto jpeg = PolicyEngine::buildPlan(record(MediaKind::IMAGE, "jpeg"), CdrLevel::REMUX, settings_);
    ASSERT_TRUE(jpeg.success);
    EXPECT_EQ(jpeg.plan.container, "jpeg");
    EXPECT_EQ(jpeg.plan.extension, "jpg");
    EXPECT_EQ(jpeg.plan.video.encoder, "jpeg");

    auto transcode = PolicyEngine::buildPlan(record(MediaKind::IMAGE, "jpeg"), CdrLevel::TRANSCODE, settings_);
    ASSERT_TRUE(transcode.success);
    EXPECT_EQ(transcode.plan.container, "png");
}

TEST_F(PolicyEngineTest, AudioTargetsM4a)
{
    auto plan = PolicyEngine::buildPlan(record(MediaKind::AUDIO, "wav"), CdrLevel::TRANSCODE, settings_);
    ASSERT_TRUE(plan.success);
    EXPECT_EQ(plan.plan.container, "ipod");
    EXPECT_EQ(plan.plan.extension, "m4a");
    EXPECT_EQ(plan.plan.video.mode, StreamMode::DROP);
    EXPECT_EQ(plan.plan.audio.bitrate_kbps, settings_.audio_bitrate_kbps);

    auto hardcore = PolicyEngine::buildPlan(record(MediaKind::AUDIO, "flac"), CdrLevel::HARDCORE, settings_);
    ASSERT_TRUE(hardcore.success);
    EXPECT_EQ(hardcore.plan.effective_level, CdrLevel::TRANSCODE);
    EXPECT_FALSE(hardcore.plan.degradation_note.empty());
}

TEST_F(PolicyEngineTest, UnknownKindIsUnsupportedLevel)
{
    auto plan = PolicyEngine::buildPlan(record(MediaKind::UNKNOWN, ""), CdrLevel::TRANSCODE, settings_);
    EXPECT_FALSE(plan.success);
    EXPECT_EQ(plan.failure_kind, FailureKind::UNSUPPORTED_LEVEL);
}

TEST_F(PolicyEngineTest, LevelNamesParse)
{
    auto numeric = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "mp4"), "3", settings_);
    ASSERT_TRUE(numeric.success);
    EXPECT_EQ(numeric.plan.requested_level, CdrLevel::HARDCORE);

    auto lower = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "mp4"), "remux", settings_);
    ASSERT_TRUE(lower.success);
    EXPECT_EQ(lower.plan.requested_level, CdrLevel::REMUX);

    auto bogus = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "mp4"), "paranoid", settings_);
    EXPECT_FALSE(bogus.success);
    EXPECT_EQ(bogus.failure_kind, FailureKind::UNSUPPORTED_LEVEL);
}

TEST_F(PolicyEngineTest, SettingsFlowIntoPlan)
{
    settings_.reconstruction.video_crf = 30;
    settings_.reconstruction.max_fps = 24;
    auto plan = PolicyEngine::buildPlan(record(MediaKind::VIDEO, "mp4"), CdrLevel::TRANSCODE, settings_);
    ASSERT_TRUE(plan.success);
    EXPECT_EQ(plan.plan.settings.video_crf, 30);
    EXPECT_EQ(plan.plan.settings.max_fps, 24);
    EXPECT_TRUE(plan.plan.strip_metadata);
    EXPECT_TRUE(plan.plan.strip_sei);
}

TEST_F(PolicyEngineTest, EveryKnownKindHasEveryLevel)
{
    for (MediaKind kind : {MediaKind::VIDEO, MediaKind::IMAGE, MediaKind::AUDIO})
    {
        for (CdrLevel level : {CdrLevel::REMUX, CdrLevel::TRANSCODE, CdrLevel::HARDCORE})
        {
            const PolicyEntry *entry = PolicyEngine::getPolicyEntry(kind, level);
            ASSERT_NE(entry, nullptr) << MediaKinds::getName(kind) << " " << CdrLevels::getLevelName(level);
            EXPECT_EQ(entry->effective_level != level, !entry->degradation_note.empty());
        }
    }
}
