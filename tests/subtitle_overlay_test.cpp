#include <gtest/gtest.h>
#include "core/reconstruction/subtitle_overlay.hpp"
#include "logging/logger.hpp"

class SubtitleTextTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
    }
};

TEST_F(SubtitleTextTest, RemovesAssOverridesAndTags)
{
    EXPECT_EQ(SubtitleText::sanitize("{\\an8\\pos(10,10)}Hello <i>world</i>"), "Hello world");
    EXPECT_EQ(SubtitleText::sanitize("<font color=\"red\">Line one</font>\\NLine two"), "Line one\nLine two");
    EXPECT_EQ(SubtitleText::sanitize("a\\hb"), "a b");
}

TEST_F(SubtitleTextTest, RemovesControlAndInvisibleCharacters)
{
    std::string raw = std::string("ab\x01\x07" "c") + "\xE2\x80\x8B" + "d" + "\xE2\x80\xAE" + "e";
    EXPECT_EQ(SubtitleText::sanitize(raw), "abcde");
    EXPECT_EQ(SubtitleText::sanitize("first\r\nsecond"), "first\nsecond");
    EXPECT_EQ(SubtitleText::sanitize("tab\there"), "tab here");
}

TEST_F(SubtitleTextTest, DropsInvalidUtf8AndKeepsValid)
{
    EXPECT_EQ(SubtitleText::sanitize("ok\xFF\xFE" "fine"), "okfine");
    EXPECT_EQ(SubtitleText::sanitize("\xC0\xAF" "x"), "x");
    EXPECT_EQ(SubtitleText::sanitize("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST_F(SubtitleTextTest, TrimsBlankLines)
{
    EXPECT_EQ(SubtitleText::sanitize("  \\N  spaced  \\N\\N"), "spaced");
    EXPECT_EQ(SubtitleText::sanitize("{\\b1}"), "");
}

TEST_F(SubtitleTextTest, UnterminatedMarkupDropsRemainder)
{
    EXPECT_EQ(SubtitleText::sanitize("visible {\\fad(100"), "visible");
    EXPECT_EQ(SubtitleText::sanitize("visible <script"), "visible");
}

TEST_F(SubtitleTextTest, CapsLengthOnCharacterBoundary)
{
    std::string raw;
    for (int i = 0; i < 10; ++i)
        raw += "\xC3\xA9";
    std::string cut = SubtitleText::sanitize(raw, 5);
    EXPECT_EQ(cut.size(), 4u);
    EXPECT_EQ(cut, "\xC3\xA9\xC3\xA9");

    std::string longer(5000, 'x');
    EXPECT_EQ(SubtitleText::sanitize(longer).size(), SubtitleText::MAX_EVENT_TEXT_BYTES);
}

TEST_F(SubtitleTextTest, AssDialogueTextField)
{
    EXPECT_EQ(SubtitleText::fromAssDialogue("0,0,Default,,0,0,0,,Hello, there"), "Hello, there");
    EXPECT_EQ(SubtitleText::fromAssDialogue("no commas"), "no commas");
}

TEST_F(SubtitleTextTest, RenderableIsAscii)
{
    EXPECT_EQ(SubtitleText::toRenderable("caf\xC3\xA9\nok"), "caf?\nok");
}

TEST(SubtitleOverlayTest, EventWindowIsHalfOpen)
{
    std::vector<SubtitleEvent> events;
    events.push_back(SubtitleEvent{1000, 2000, "hello", {}});
    events.push_back(SubtitleEvent{3000, 3500, "again", {}});
    SubtitleOverlay overlay(events, 0, 0);

    EXPECT_FALSE(overlay.empty());
    EXPECT_FALSE(overlay.hasEventAt(999));
    EXPECT_TRUE(overlay.hasEventAt(1000));
    EXPECT_TRUE(overlay.hasEventAt(1999));
    EXPECT_FALSE(overlay.hasEventAt(2000));
    EXPECT_TRUE(overlay.hasEventAt(3200));
}

TEST(SubtitleOverlayTest, RendersTextOnlyWhileActive)
{
    std::vector<SubtitleEvent> events;
    events.push_back(SubtitleEvent{0, 1000, "BURNED", {}});
    SubtitleOverlay overlay(events, 0, 0);

    cv::Mat idle(120, 160, CV_8UC3, cv::Scalar(40, 80, 120));
    overlay.render(idle, 1500);
    EXPECT_EQ(cv::countNonZero(cv::Mat(idle != cv::Scalar(40, 80, 120)).reshape(1)), 0);

    cv::Mat active(120, 160, CV_8UC3, cv::Scalar(40, 80, 120));
    overlay.render(active, 500);
    EXPECT_GT(cv::countNonZero(cv::Mat(active != cv::Scalar(40, 80, 120)).reshape(1)), 0);
}

TEST(SubtitleOverlayTest, BitmapIsScaledToFrameAndAlphaBlended)
{
    SubtitleBitmap bitmap{10, 10, cv::Mat(10, 10, CV_8UC4, cv::Scalar(0, 0, 255, 255))};
    std::vector<SubtitleEvent> events;
    events.push_back(SubtitleEvent{0, 1000, "", {bitmap}});
    SubtitleOverlay overlay(events, 80, 60);

    cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(0, 0, 0));
    overlay.render(frame, 0);

    // Canvas 80x60 onto 160x120 doubles coordinates and size
    EXPECT_EQ(frame.at<cv::Vec3b>(25, 25), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(frame.at<cv::Vec3b>(5, 5), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(frame.at<cv::Vec3b>(45, 45), cv::Vec3b(0, 0, 0));
}
