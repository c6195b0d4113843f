/*
 * File:        ffmpeg_backend.cpp
 * Module:      compshot-core
 * Purpose:     FFmpeg/libavfilter implementation of the video backend
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "ffmpeg_backend.h"

#ifdef HAVE_FFMPEG

#include "errors.h"
#include "filter_chain.h"
#include "logging.h"
#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
}

namespace compshot {

namespace {

std::string av_error_string(int err) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

AVRational stream_frame_rate(const AVStream* stream) {
    if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0) {
        return stream->avg_frame_rate;
    }
    if (stream->r_frame_rate.num > 0 && stream->r_frame_rate.den > 0) {
        return stream->r_frame_rate;
    }
    return AVRational{24000, 1001};
}

/**
 * @brief Demuxer and decoder for the best video stream of one file
 */
class MediaSource {
public:
    explicit MediaSource(const std::string& path);
    ~MediaSource() { cleanup(); }

    MediaSource(const MediaSource&) = delete;
    MediaSource& operator=(const MediaSource&) = delete;

    const AVStream* stream() const { return format_ctx_->streams[stream_index_]; }
    const AVFormatContext* format() const { return format_ctx_; }

    /// Decode frame @p frame_number; the frame stays owned by this source
    const AVFrame* decode(int64_t frame_number);

private:
    [[noreturn]] void fail(const std::string& message);
    void cleanup();

    std::string path_;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    int stream_index_ = -1;
};

MediaSource::MediaSource(const std::string& path)
    : path_(path)
{
    int ret = avformat_open_input(&format_ctx_, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        fail(fmt::format("Failed to open '{}': {}", path, av_error_string(ret)));
    }

    ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
        fail(fmt::format("Failed to read stream info from '{}': {}", path, av_error_string(ret)));
    }

    const AVCodec* codec = nullptr;
    stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (stream_index_ < 0 || !codec) {
        fail(fmt::format("No decodable video stream in '{}'", path));
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        fail("Failed to allocate decoder context");
    }

    ret = avcodec_parameters_to_context(codec_ctx_, format_ctx_->streams[stream_index_]->codecpar);
    if (ret < 0) {
        fail(fmt::format("Failed to configure decoder: {}", av_error_string(ret)));
    }

    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        fail(fmt::format("Failed to open {} decoder: {}", codec->name, av_error_string(ret)));
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        fail("Failed to allocate packet/frame");
    }
}

void MediaSource::fail(const std::string& message) {
    cleanup();
    throw std::runtime_error(message);
}

void MediaSource::cleanup() {
    if (frame_) {
        av_frame_free(&frame_);
    }
    if (packet_) {
        av_packet_free(&packet_);
    }
    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }
    if (format_ctx_) {
        avformat_close_input(&format_ctx_);
    }
}

const AVFrame* MediaSource::decode(int64_t frame_number) {
    const AVStream* st = stream();
    const AVRational frame_duration = av_inv_q(stream_frame_rate(st));
    const int64_t start = st->start_time != AV_NOPTS_VALUE ? st->start_time : 0;
    const int64_t target = start + av_rescale_q(frame_number, frame_duration, st->time_base);
    const int64_t tolerance = av_rescale_q(1, frame_duration, st->time_base) / 2;

    int ret = av_seek_frame(format_ctx_, stream_index_, target, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Seek to frame {} failed in '{}': {}",
                                             frame_number, path_, av_error_string(ret)));
    }
    avcodec_flush_buffers(codec_ctx_);

    bool draining = false;
    while (true) {
        if (!draining) {
            ret = av_read_frame(format_ctx_, packet_);
            if (ret < 0) {
                draining = true;
                ret = avcodec_send_packet(codec_ctx_, nullptr);
                if (ret < 0 && ret != AVERROR_EOF) {
                    throw std::runtime_error(fmt::format("Draining '{}' failed: {}", path_, av_error_string(ret)));
                }
            } else if (packet_->stream_index != stream_index_) {
                av_packet_unref(packet_);
                continue;
            } else {
                ret = avcodec_send_packet(codec_ctx_, packet_);
                av_packet_unref(packet_);
                if (ret < 0 && ret != AVERROR(EAGAIN)) {
                    throw std::runtime_error(fmt::format("Decoding '{}' failed: {}", path_, av_error_string(ret)));
                }
            }
        }

        while ((ret = avcodec_receive_frame(codec_ctx_, frame_)) >= 0) {
            int64_t ts = frame_->best_effort_timestamp;
            if (ts == AV_NOPTS_VALUE) {
                ts = frame_->pts;
            }
            if (ts != AV_NOPTS_VALUE && ts >= target - tolerance) {
                return frame_;
            }
            av_frame_unref(frame_);
        }

        if (ret == AVERROR_EOF) {
            throw std::runtime_error(fmt::format("Frame {} not found in '{}'", frame_number, path_));
        }
        if (ret != AVERROR(EAGAIN)) {
            throw std::runtime_error(fmt::format("Decoding '{}' failed: {}", path_, av_error_string(ret)));
        }
    }
}

/**
 * @brief Owned filter graph: buffer -> chain -> rgb24 -> buffersink
 */
class FilterGraph {
public:
    FilterGraph() : graph_(avfilter_graph_alloc()) {
        if (!graph_) {
            throw std::runtime_error("Failed to allocate filter graph");
        }
    }
    ~FilterGraph() { avfilter_graph_free(&graph_); }

    FilterGraph(const FilterGraph&) = delete;
    FilterGraph& operator=(const FilterGraph&) = delete;

    void build(const AVFrame* frame, AVRational time_base, const FilterChain& chain);
    RgbImage run(const AVFrame* frame);

private:
    AVFilterContext* add(const FilterSpec& spec, const std::string& label);

    AVFilterGraph* graph_ = nullptr;
    AVFilterContext* source_ = nullptr;
    AVFilterContext* sink_ = nullptr;
};

AVFilterContext* FilterGraph::add(const FilterSpec& spec, const std::string& label) {
    const AVFilter* filter = avfilter_get_by_name(spec.name.c_str());
    if (!filter) {
        throw BackendUnavailableError(fmt::format("FFmpeg filter '{}' is not available", spec.name));
    }

    AVFilterContext* ctx = avfilter_graph_alloc_filter(graph_, filter, label.c_str());
    if (!ctx) {
        throw std::runtime_error(fmt::format("Failed to allocate filter '{}'", spec.name));
    }

    for (const auto& [key, value] : spec.options) {
        int ret = av_opt_set(ctx, key.c_str(), value.c_str(), AV_OPT_SEARCH_CHILDREN);
        if (ret < 0) {
            throw std::runtime_error(fmt::format("{}: cannot set {}={}: {}",
                                                 spec.name, key, value, av_error_string(ret)));
        }
    }

    int ret = avfilter_init_str(ctx, nullptr);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to initialize filter '{}': {}",
                                             spec.name, av_error_string(ret)));
    }
    return ctx;
}

void FilterGraph::build(const AVFrame* frame, AVRational time_base, const FilterChain& chain) {
    AVRational sar = frame->sample_aspect_ratio;
    if (sar.num <= 0 || sar.den <= 0) {
        sar = AVRational{1, 1};
    }

    const std::string args = fmt::format("video_size={}x{}:pix_fmt={}:time_base={}/{}:pixel_aspect={}/{}",
                                         frame->width, frame->height, frame->format,
                                         time_base.num, time_base.den, sar.num, sar.den);
    int ret = avfilter_graph_create_filter(&source_, avfilter_get_by_name("buffer"), "in",
                                           args.c_str(), nullptr, graph_);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to create buffer source: {}", av_error_string(ret)));
    }

    AVFilterContext* last = source_;
    int index = 0;
    for (const auto& spec : chain) {
        AVFilterContext* ctx = add(spec, fmt::format("step{}_{}", index++, spec.name));
        ret = avfilter_link(last, 0, ctx, 0);
        if (ret < 0) {
            throw std::runtime_error(fmt::format("Failed to link '{}': {}", spec.name, av_error_string(ret)));
        }
        last = ctx;
    }

    // Output conversion
    AVFilterContext* output = add(FilterSpec{"format", {{"pix_fmts", "rgb24"}}}, "output_format");
    ret = avfilter_link(last, 0, output, 0);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to link output format: {}", av_error_string(ret)));
    }

    ret = avfilter_graph_create_filter(&sink_, avfilter_get_by_name("buffersink"), "out",
                                       nullptr, nullptr, graph_);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to create buffer sink: {}", av_error_string(ret)));
    }
    ret = avfilter_link(output, 0, sink_, 0);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to link buffer sink: {}", av_error_string(ret)));
    }

    ret = avfilter_graph_config(graph_, nullptr);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to configure filter graph: {}", av_error_string(ret)));
    }
}

RgbImage FilterGraph::run(const AVFrame* frame) {
    int ret = av_buffersrc_add_frame_flags(source_, const_cast<AVFrame*>(frame), AV_BUFFERSRC_FLAG_KEEP_REF);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to feed filter graph: {}", av_error_string(ret)));
    }
    ret = av_buffersrc_add_frame_flags(source_, nullptr, 0);
    if (ret < 0) {
        throw std::runtime_error(fmt::format("Failed to flush filter graph: {}", av_error_string(ret)));
    }

    AVFrame* out = av_frame_alloc();
    if (!out) {
        throw std::runtime_error("Failed to allocate output frame");
    }
    ret = av_buffersink_get_frame(sink_, out);
    if (ret < 0) {
        av_frame_free(&out);
        throw std::runtime_error(fmt::format("Filter graph produced no frame: {}", av_error_string(ret)));
    }

    RgbImage image;
    image.width = static_cast<uint32_t>(out->width);
    image.height = static_cast<uint32_t>(out->height);
    image.rgb_data.resize(static_cast<size_t>(image.width) * image.height * 3);
    const size_t row_bytes = static_cast<size_t>(image.width) * 3;
    for (uint32_t y = 0; y < image.height; ++y) {
        std::memcpy(&image.rgb_data[y * row_bytes], out->data[0] + static_cast<ptrdiff_t>(y) * out->linesize[0],
                    row_bytes);
    }

    av_frame_free(&out);
    return image;
}

VideoFormat format_of(AVPixelFormat pix_fmt) {
    VideoFormat format;
    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(pix_fmt);
    if (!desc) {
        return format;
    }
    if (desc->flags & AV_PIX_FMT_FLAG_RGB) {
        format.family = ColorFamily::RGB;
    } else if (desc->nb_components <= 2) {
        format.family = ColorFamily::Gray;
    } else {
        format.family = ColorFamily::YUV;
    }
    format.bits_per_sample = desc->comp[0].depth;
    return format;
}

FrameProps props_of(const AVCodecParameters* par) {
    FrameProps props;
    if (par->color_space != AVCOL_SPC_UNSPECIFIED && par->color_space != AVCOL_SPC_RESERVED) {
        props[prop::MATRIX] = static_cast<int64_t>(par->color_space);
    }
    if (par->color_trc != AVCOL_TRC_UNSPECIFIED && par->color_trc != AVCOL_TRC_RESERVED0 &&
        par->color_trc != AVCOL_TRC_RESERVED) {
        props[prop::TRANSFER] = static_cast<int64_t>(par->color_trc);
    }
    if (par->color_primaries != AVCOL_PRI_UNSPECIFIED && par->color_primaries != AVCOL_PRI_RESERVED0 &&
        par->color_primaries != AVCOL_PRI_RESERVED) {
        props[prop::PRIMARIES] = static_cast<int64_t>(par->color_primaries);
    }
    if (par->color_range == AVCOL_RANGE_MPEG) {
        props[prop::COLOR_RANGE] = static_cast<int64_t>(code::RANGE_LIMITED);
    } else if (par->color_range == AVCOL_RANGE_JPEG) {
        props[prop::COLOR_RANGE] = static_cast<int64_t>(code::RANGE_FULL);
    }
    return props;
}

int64_t frame_count_of(const AVFormatContext* fmt_ctx, const AVStream* stream) {
    if (stream->nb_frames > 0) {
        return stream->nb_frames;
    }
    const AVRational fps = stream_frame_rate(stream);
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        return av_rescale_q(stream->duration, stream->time_base, av_inv_q(fps));
    }
    if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
        return av_rescale_q(fmt_ctx->duration, AVRational{1, AV_TIME_BASE}, av_inv_q(fps));
    }
    return 0;
}

} // anonymous namespace

FFmpegBackend::FFmpegBackend()
{
    av_log_set_level(AV_LOG_ERROR);
}

Clip FFmpegBackend::load(SourceFilter filter,
                         const std::filesystem::path& path,
                         const std::filesystem::path& cache_path) const {
    COMPSHOT_LOG_DEBUG("FFmpegBackend: probing '{}' ({} requested, index cache '{}' not used)",
                       path.string(), source_filter_name(filter), cache_path.string());

    MediaSource source(path.string());
    const AVStream* stream = source.stream();
    const AVCodecParameters* par = stream->codecpar;
    const AVRational fps = stream_frame_rate(stream);

    ClipInfo info;
    info.width = par->width;
    info.height = par->height;
    info.num_frames = frame_count_of(source.format(), stream);
    info.fps_num = fps.num;
    info.fps_den = fps.den;
    info.format = format_of(static_cast<AVPixelFormat>(par->format));

    if (info.width <= 0 || info.height <= 0 || info.num_frames <= 0) {
        throw std::runtime_error(fmt::format("Could not determine geometry or length of '{}'", path.string()));
    }

    COMPSHOT_LOG_DEBUG("FFmpegBackend: {}x{} {} frames {}/{} fps {}", info.width, info.height,
                       info.num_frames, info.fps_num, info.fps_den, to_string(info.format));

    return Clip(path.string(), source_filter_name(filter), info, props_of(par));
}

Clip FFmpegBackend::resize(const Clip& clip, const ResizeRequest& request) const {
    if (!avfilter_get_by_name("zscale")) {
        throw BackendUnavailableError("FFmpeg was built without the zscale filter (libzimg); cannot resize");
    }
    return ChainedBackend::resize(clip, request);
}

bool FFmpegBackend::has_tonemap() const {
    return avfilter_get_by_name("libplacebo") != nullptr;
}

Clip FFmpegBackend::tonemap(const Clip& clip, const ParameterSet& parameters) const {
    const AVFilter* placebo = avfilter_get_by_name("libplacebo");
    if (!placebo) {
        throw BackendUnavailableError("FFmpeg was built without the libplacebo filter");
    }

    std::vector<std::string> rejected = unmapped_tonemap_keys(parameters);
    const AVClass* placebo_class = placebo->priv_class;
    for (const auto& [key, value] : parameters) {
        auto option = libplacebo_option(key);
        if (!option) {
            continue;
        }
        if (!placebo_class ||
            !av_opt_find(&placebo_class, option->c_str(), nullptr, 0, AV_OPT_SEARCH_FAKE_OBJ)) {
            rejected.push_back(key);
        }
    }

    if (!rejected.empty()) {
        std::sort(rejected.begin(), rejected.end());
        std::string names;
        for (const auto& name : rejected) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        throw TonemapAttemptError("libplacebo: Tonemap does not take argument(s) named " + names);
    }

    // Values the filter cannot express fail the attempt
    try {
        build_filter_chain({ClipStep{step::TONEMAP, parameters}}, FrameStamp{});
    } catch (const ConfigurationError& e) {
        throw TonemapAttemptError(std::string("libplacebo: ") + e.what());
    }

    return tonemap_step(clip, parameters);
}

RgbImage FFmpegBackend::render(const Clip& clip, int64_t frame) const {
    MediaSource source(clip.source_path());
    const AVFrame* decoded = source.decode(frame);

    FrameStamp stamp;
    stamp.frame = frame;
    stamp.total_frames = clip.num_frames();
    stamp.picture_type = av_get_picture_type_char(decoded->pict_type);

    const FilterChain chain = build_filter_chain(clip.steps(), stamp);
    COMPSHOT_LOG_DEBUG("FFmpegBackend: frame {} of '{}' through {}", frame, clip.source_path(), to_string(chain));

    FilterGraph graph;
    graph.build(decoded, source.stream()->time_base, chain);
    return graph.run(decoded);
}

void FFmpegBackend::write_frame(const Clip& clip, int64_t frame, const std::filesystem::path& path) const {
    write_png(render(clip, frame), path.string());
}

} // namespace compshot

#endif // HAVE_FFMPEG
