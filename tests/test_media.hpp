#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include "core/external_library_wrappers.hpp"
#include "core/metadata_stripper.hpp"
#include "logging/logger.hpp"

namespace fs = std::filesystem;

/**
 * @brief Scratch directory per test, removed in TearDown
 */
class MediaTestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() /
                    ("mediacdr_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                     std::to_string(getpid()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    fs::path test_dir_;
};

/**
 * @brief Media fixtures generated in-process
 */
class TestMedia
{
public:
    static void writeFile(const fs::path &path, const std::vector<uint8_t> &bytes)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    static void writeFile(const fs::path &path, const std::string &text)
    {
        writeFile(path, std::vector<uint8_t>(text.begin(), text.end()));
    }

    static std::vector<uint8_t> readFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    static bool contains(const std::vector<uint8_t> &data, const std::string &needle)
    {
        if (needle.empty() || data.size() < needle.size())
            return false;
        return std::search(data.begin(), data.end(), needle.begin(), needle.end()) != data.end();
    }

    static cv::Mat gradient(int width, int height)
    {
        cv::Mat image(height, width, CV_8UC3);
        for (int y = 0; y < height; ++y)
        {
            for (int x = 0; x < width; ++x)
                image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uint8_t>(x * 255 / width),
                                                      static_cast<uint8_t>(y * 255 / height), 128);
        }
        return image;
    }

    static std::vector<uint8_t> makePng(int width, int height)
    {
        std::vector<uint8_t> out;
        cv::imencode(".png", gradient(width, height), out);
        return out;
    }

    static std::vector<uint8_t> makeJpeg(int width, int height)
    {
        std::vector<uint8_t> out;
        cv::imencode(".jpg", gradient(width, height), out, {cv::IMWRITE_JPEG_QUALITY, 90});
        return out;
    }

    /**
     * @brief JPEG with an EXIF APP1 segment carrying the marker text right after SOI
     */
    static std::vector<uint8_t> makeJpegWithExif(int width, int height, const std::string &marker)
    {
        std::vector<uint8_t> jpeg = makeJpeg(width, height);
        std::string payload = std::string("Exif\0\0", 6) + "MM" + marker;
        size_t length = payload.size() + 2;
        std::vector<uint8_t> app1 = {0xFF, 0xE1, static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF)};
        app1.insert(app1.end(), payload.begin(), payload.end());
        jpeg.insert(jpeg.begin() + 2, app1.begin(), app1.end());
        return jpeg;
    }

    // JPEG followed by a script payload after EOI
    static std::vector<uint8_t> makePolyglot(const std::string &payload)
    {
        std::vector<uint8_t> jpeg = makeJpeg(64, 48);
        jpeg.insert(jpeg.end(), payload.begin(), payload.end());
        return jpeg;
    }

    static void appendPngChunk(std::vector<uint8_t> &png, const std::string &type, const std::vector<uint8_t> &body)
    {
        uint32_t length = static_cast<uint32_t>(body.size());
        for (int shift = 24; shift >= 0; shift -= 8)
            png.push_back(static_cast<uint8_t>(length >> shift));
        std::vector<uint8_t> typed(type.begin(), type.end());
        typed.insert(typed.end(), body.begin(), body.end());
        png.insert(png.end(), typed.begin(), typed.end());
        uint32_t crc = MetadataStripper::crc32(typed.data(), typed.size());
        for (int shift = 24; shift >= 0; shift -= 8)
            png.push_back(static_cast<uint8_t>(crc >> shift));
    }

    /**
     * @brief PNG whose header declares width x height with a token IDAT
     */
    static std::vector<uint8_t> makePngBomb(uint32_t width, uint32_t height)
    {
        std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
        std::vector<uint8_t> ihdr;
        for (uint32_t value : {width, height})
            for (int shift = 24; shift >= 0; shift -= 8)
                ihdr.push_back(static_cast<uint8_t>(value >> shift));
        ihdr.insert(ihdr.end(), {8, 2, 0, 0, 0});
        appendPngChunk(png, "IHDR", ihdr);
        appendPngChunk(png, "IDAT", {0x78, 0x9C, 0x63, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01});
        appendPngChunk(png, "IEND", {});
        return png;
    }

    /**
     * @brief Baseline JPEG header whose SOF0 sits behind an APP1 of app1_bytes
     */
    static std::vector<uint8_t> makeJpegBomb(uint16_t width, uint16_t height, size_t app1_bytes)
    {
        std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE1};
        size_t length = app1_bytes + 2;
        jpeg.push_back(static_cast<uint8_t>(length >> 8));
        jpeg.push_back(static_cast<uint8_t>(length & 0xFF));
        const char exif[] = {'E', 'x', 'i', 'f', 0, 0};
        jpeg.insert(jpeg.end(), exif, exif + sizeof(exif));
        jpeg.resize(jpeg.size() + app1_bytes - sizeof(exif), 0);
        jpeg.insert(jpeg.end(), {0xFF, 0xC0, 0x00, 0x11, 0x08,
                                 static_cast<uint8_t>(height >> 8), static_cast<uint8_t>(height & 0xFF),
                                 static_cast<uint8_t>(width >> 8), static_cast<uint8_t>(width & 0xFF),
                                 0x03, 0x01, 0x22, 0x00, 0x02, 0x11, 0x01, 0x03, 0x11, 0x01});
        jpeg.insert(jpeg.end(), {0xFF, 0xD9});
        return jpeg;
    }

    /**
     * @brief TIFF header with an IFD declaring width x height and no strips
     */
    static std::vector<uint8_t> makeTiffBomb(uint32_t width, uint32_t height, bool big_endian = false)
    {
        std::vector<uint8_t> tiff;
        auto put16 = [&tiff, big_endian](uint16_t v)
        {
            if (big_endian)
                tiff.insert(tiff.end(), {static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v & 0xFF)});
            else
                tiff.insert(tiff.end(), {static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>(v >> 8)});
        };
        auto put32 = [&put16, big_endian](uint32_t v)
        {
            put16(static_cast<uint16_t>(big_endian ? v >> 16 : v & 0xFFFF));
            put16(static_cast<uint16_t>(big_endian ? v & 0xFFFF : v >> 16));
        };

        uint8_t order = big_endian ? 'M' : 'I';
        tiff.insert(tiff.end(), {order, order});
        put16(42);
        put32(8);
        put16(3);
        put16(256);
        put16(4);
        put32(1);
        put32(width);
        put16(257);
        put16(4);
        put32(1);
        put32(height);
        // BitsPerSample, a SHORT stored in the first half of the value field
        put16(258);
        put16(3);
        put32(1);
        put16(8);
        put16(0);
        put32(0);
        return tiff;
    }

    /**
     * @brief 16-bit PCM WAV with a LIST/INFO chunk holding the artist
     */
    static std::vector<uint8_t> makeWav(int sample_rate, int channels, double seconds, const std::string &artist)
    {
        std::vector<uint8_t> wav;
        auto le32 = [&wav](uint32_t v)
        { for (int i = 0; i < 4; ++i) wav.push_back(static_cast<uint8_t>(v >> (8 * i))); };
        auto le16 = [&wav](uint16_t v)
        { wav.push_back(static_cast<uint8_t>(v & 0xFF)); wav.push_back(static_cast<uint8_t>(v >> 8)); };
        auto tag = [&wav](const char *t)
        { wav.insert(wav.end(), t, t + 4); };

        uint32_t frames = static_cast<uint32_t>(sample_rate * seconds);
        uint32_t data_bytes = frames * static_cast<uint32_t>(channels) * 2;
        std::string info_text = artist + std::string(1, '\0');
        if (info_text.size() % 2)
            info_text.push_back('\0');
        uint32_t list_bytes = 4 + 8 + static_cast<uint32_t>(info_text.size());

        tag("RIFF");
        le32(4 + 24 + 8 + list_bytes + 8 + data_bytes);
        tag("WAVE");
        tag("fmt ");
        le32(16);
        le16(1);
        le16(static_cast<uint16_t>(channels));
        le32(static_cast<uint32_t>(sample_rate));
        le32(static_cast<uint32_t>(sample_rate * channels * 2));
        le16(static_cast<uint16_t>(channels * 2));
        le16(16);
        tag("LIST");
        le32(list_bytes);
        tag("INFO");
        tag("IART");
        le32(static_cast<uint32_t>(info_text.size()));
        wav.insert(wav.end(), info_text.begin(), info_text.end());
        tag("data");
        le32(data_bytes);
        for (uint32_t i = 0; i < frames; ++i)
        {
            int16_t sample = static_cast<int16_t>(8000 * std::sin(2.0 * M_PI * 440.0 * i / sample_rate));
            for (int c = 0; c < channels; ++c)
                le16(static_cast<uint16_t>(sample));
        }
        return wav;
    }

    struct SubtitleCue
    {
        int64_t start_ms;
        int64_t duration_ms;
        std::string text;
    };

    /**
     * @brief Short MPEG-4 Part 2 video in mp4 or matroska, with container
     *        metadata and optional SubRip cues
     * @return false when the local FFmpeg build lacks a needed component
     */
    static bool makeVideo(const fs::path &path, const std::string &muxer, int frames,
                          const std::map<std::string, std::string> &metadata,
                          const std::vector<SubtitleCue> &cues = {})
    {
        OutputFormatContextRAII format;
        if (avformat_alloc_output_context2(format.address(), nullptr, muxer.c_str(), path.string().c_str()) < 0)
            return false;
        AVFormatContext *raw_format = format.get();
        for (const auto &entry : metadata)
            av_dict_set(&raw_format->metadata, entry.first.c_str(), entry.second.c_str(), 0);

        if (avio_open(&raw_format->pb, path.string().c_str(), AVIO_FLAG_WRITE) < 0)
            return false;
        bool written = writeVideo(raw_format, frames, cues);
        avio_closep(&raw_format->pb);
        return written;
    }

    /**
     * @brief Stream types present in a media file, e.g. {"video", "subtitle"}
     */
    static std::vector<std::string> streamTypes(const fs::path &path, std::string *subtitle_codec = nullptr)
    {
        std::vector<std::string> types;
        AVFormatContextRAII format;
        if (avformat_open_input(format.address(), path.string().c_str(), nullptr, nullptr) < 0)
            return types;
        AVFormatContext *raw = format.get();
        if (avformat_find_stream_info(raw, nullptr) < 0)
            return types;
        for (unsigned i = 0; i < raw->nb_streams; ++i)
        {
            const AVCodecParameters *par = raw->streams[i]->codecpar;
            const char *name = av_get_media_type_string(par->codec_type);
            types.push_back(name ? name : "unknown");
            if (par->codec_type == AVMEDIA_TYPE_SUBTITLE && subtitle_codec)
                *subtitle_codec = avcodec_get_name(par->codec_id);
        }
        return types;
    }

    // Whether any container or stream metadata value contains the needle
    static bool hasTagValue(const fs::path &path, const std::string &needle)
    {
        AVFormatContextRAII format;
        if (avformat_open_input(format.address(), path.string().c_str(), nullptr, nullptr) < 0)
            return false;
        auto search = [&needle](const AVDictionary *dict)
        {
            const AVDictionaryEntry *entry = nullptr;
            while ((entry = av_dict_get(dict, "", entry, AV_DICT_IGNORE_SUFFIX)))
            {
                if (std::string(entry->value).find(needle) != std::string::npos)
                    return true;
            }
            return false;
        };
        if (search(format.get()->metadata))
            return true;
        for (unsigned i = 0; i < format.get()->nb_streams; ++i)
        {
            if (search(format.get()->streams[i]->metadata))
                return true;
        }
        return false;
    }

private:
    static bool writeVideo(AVFormatContext *raw_format, int frames, const std::vector<SubtitleCue> &cues)
    {
        const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
        if (!codec)
            return false;
        AVCodecContextRAII encoder(avcodec_alloc_context3(codec));
        AVCodecContext *enc = encoder.get();
        if (!enc)
            return false;
        enc->width = 160;
        enc->height = 120;
        enc->pix_fmt = AV_PIX_FMT_YUV420P;
        enc->time_base = AVRational{1, 25};
        enc->framerate = AVRational{25, 1};
        enc->gop_size = 10;
        if (raw_format->oformat->flags & AVFMT_GLOBALHEADER)
            enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        if (avcodec_open2(enc, codec, nullptr) < 0)
            return false;

        AVStream *video = avformat_new_stream(raw_format, nullptr);
        if (!video || avcodec_parameters_from_context(video->codecpar, enc) < 0)
            return false;
        video->time_base = enc->time_base;

        AVStream *subtitle = nullptr;
        if (!cues.empty())
        {
            subtitle = avformat_new_stream(raw_format, nullptr);
            if (!subtitle)
                return false;
            subtitle->codecpar->codec_type = AVMEDIA_TYPE_SUBTITLE;
            subtitle->codecpar->codec_id = AV_CODEC_ID_SUBRIP;
            subtitle->time_base = AVRational{1, 1000};
        }

        if (avformat_write_header(raw_format, nullptr) < 0)
            return false;

        AVFrameRAII frame;
        frame->format = enc->pix_fmt;
        frame->width = enc->width;
        frame->height = enc->height;
        if (av_frame_get_buffer(frame.get(), 0) < 0)
            return false;

        AVPacketRAII packet;
        auto drain = [&]() -> bool
        {
            while (true)
            {
                int ret = avcodec_receive_packet(enc, packet.get());
                if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
                    return true;
                if (ret < 0)
                    return false;
                av_packet_rescale_ts(packet.get(), enc->time_base, video->time_base);
                packet->stream_index = video->index;
                if (av_interleaved_write_frame(raw_format, packet.get()) < 0)
                    return false;
            }
        };

        size_t next_cue = 0;
        for (int i = 0; i < frames; ++i)
        {
            if (av_frame_make_writable(frame.get()) < 0)
                return false;
            for (int y = 0; y < enc->height; ++y)
                for (int x = 0; x < enc->width; ++x)
                    frame->data[0][y * frame->linesize[0] + x] = static_cast<uint8_t>(x + y + i * 3);
            for (int y = 0; y < enc->height / 2; ++y)
                for (int x = 0; x < enc->width / 2; ++x)
                {
                    frame->data[1][y * frame->linesize[1] + x] = 128;
                    frame->data[2][y * frame->linesize[2] + x] = static_cast<uint8_t>(64 + i);
                }
            frame->pts = i;
            if (avcodec_send_frame(enc, frame.get()) < 0 || !drain())
                return false;

            int64_t now_ms = static_cast<int64_t>(i) * 40;
            while (subtitle && next_cue < cues.size() && cues[next_cue].start_ms <= now_ms)
            {
                const SubtitleCue &cue = cues[next_cue++];
                AVPacketRAII text;
                if (av_new_packet(text.get(), static_cast<int>(cue.text.size())) < 0)
                    return false;
                std::memcpy(text->data, cue.text.data(), cue.text.size());
                text->pts = av_rescale_q(cue.start_ms, AVRational{1, 1000}, subtitle->time_base);
                text->dts = text->pts;
                text->duration = av_rescale_q(cue.duration_ms, AVRational{1, 1000}, subtitle->time_base);
                text->stream_index = subtitle->index;
                if (av_interleaved_write_frame(raw_format, text.get()) < 0)
                    return false;
            }
        }
        if (avcodec_send_frame(enc, nullptr) < 0 || !drain())
            return false;

        return av_write_trailer(raw_format) >= 0;
    }
};
