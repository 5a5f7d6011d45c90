#include <algorithm>
#include <array>
#include <atomic>
#include <bit>
#include <vector>

#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

#include "macros/assert.hpp"
#include "macros/autoptr.hpp"
#include "macros/logger.hpp"
#include "pipewire.hpp"
#include "util/cleaner.hpp"

namespace sound {
namespace {
auto logger = Logger("VOCALINK_PW");

declare_autoptr(PWThreadLoop, pw_thread_loop, pw_thread_loop_destroy);
declare_autoptr(PWStream, pw_stream, pw_stream_destroy);
declare_autoptr(PWProperties, pw_properties, pw_properties_free);

struct PipeWireStream : Stream {
    pw_thread_loop*       loop = nullptr;
    AutoPWStream          stream;
    const char*           name     = "";
    uint32_t              rate     = 0;
    std::atomic<uint32_t> channels = 1; // negotiated, written by the loop thread
    std::vector<float>    mono;
    CaptureCallback    on_samples;
    PlaybackCallback   on_request;
    FailureCallback    on_failure;
    bool               failed = false;

    ~PipeWireStream() override;
};

PipeWireStream::~PipeWireStream() {
    if(!stream) {
        return;
    }
    // destroying under the loop lock detaches the stream from the data thread
    pw_thread_loop_lock(loop);
    stream.reset();
    pw_thread_loop_unlock(loop);
}

auto on_state_changed(void* const userdata, const pw_stream_state /*old*/, const pw_stream_state state, const char* const error) -> void {
    auto& self = *std::bit_cast<PipeWireStream*>(userdata);

    LOG_DEBUG(logger, "stream state {}", pw_stream_state_as_string(state));
    if(state != PW_STREAM_STATE_ERROR || self.failed) {
        return;
    }
    LOG_ERROR(logger, "stream failed: {}", error != NULL ? error : "unknown");
    self.failed = true;
    if(self.on_failure) {
        self.on_failure();
    }
}

auto capture_on_process(void* const userdata) -> void {
    auto& self = *std::bit_cast<PipeWireStream*>(userdata);

    const auto pw_buffer = pw_stream_dequeue_buffer(self.stream.get());
    if(pw_buffer == NULL) {
        LOG_WARN(logger, "capture stream out of buffers");
        return;
    }
    auto cleaner = Cleaner{[&] { pw_stream_queue_buffer(self.stream.get(), pw_buffer); }};

    const auto& data = pw_buffer->buffer->datas[0];
    if(data.data == NULL) {
        return;
    }
    const auto samples      = std::bit_cast<const float*>(static_cast<const std::byte*>(data.data) + data.chunk->offset);
    const auto num_channels = self.channels.load();
    const auto num_frames   = data.chunk->size / sizeof(float) / num_channels;
    if(num_channels == 1) {
        self.on_samples({samples, num_frames});
        return;
    }
    // only use first channel
    self.mono.resize(num_frames);
    for(auto i = 0uz; i < num_frames; i += 1) {
        self.mono[i] = samples[i * num_channels];
    }
    self.on_samples(self.mono);
}

auto on_param_changed(void* const userdata, const uint32_t id, const spa_pod* const param) -> void {
    auto& self = *std::bit_cast<PipeWireStream*>(userdata);

    if(param == NULL || id != SPA_PARAM_Format) {
        return;
    }
    auto media_type    = uint32_t();
    auto media_subtype = uint32_t();
    auto raw           = spa_audio_info_raw();
    if(spa_format_parse(param, &media_type, &media_subtype) < 0 ||
       media_type != SPA_MEDIA_TYPE_audio || media_subtype != SPA_MEDIA_SUBTYPE_raw ||
       spa_format_audio_raw_parse(param, &raw) < 0) {
        LOG_WARN(logger, "{}: ignoring non raw audio format", self.name);
        return;
    }
    // the graph resamples, a different rate only means extra latency
    if(raw.rate != self.rate) {
        LOG_WARN(logger, "{}: negotiated rate {} instead of {}", self.name, raw.rate, self.rate);
    }
    self.channels = std::max(raw.channels, 1u);
    LOG_INFO(logger, "{}: format rate={} channels={}", self.name, raw.rate, raw.channels);
}

auto playback_on_process(void* const userdata) -> void {
    auto& self = *std::bit_cast<PipeWireStream*>(userdata);

    const auto pw_buffer = pw_stream_dequeue_buffer(self.stream.get());
    if(pw_buffer == NULL) {
        LOG_WARN(logger, "playback stream out of buffers");
        return;
    }
    auto cleaner = Cleaner{[&] { pw_stream_queue_buffer(self.stream.get(), pw_buffer); }};

    const auto buffer  = pw_buffer->buffer;
    const auto samples = std::bit_cast<float*>(buffer->datas[0].data);
    if(samples == NULL) {
        return;
    }

    auto num_samples = buffer->datas[0].maxsize / sizeof(float);
    if(pw_buffer->requested != 0) {
        num_samples = std::min<size_t>(pw_buffer->requested, num_samples);
    }
    self.on_request({samples, num_samples});

    const auto chunk = buffer->datas[0].chunk;
    chunk->offset    = 0;
    chunk->stride    = sizeof(float);
    chunk->size      = num_samples * sizeof(float);
}

const auto capture_stream_events = pw_stream_events{
    .version       = PW_VERSION_STREAM_EVENTS,
    .state_changed = on_state_changed,
    .param_changed = on_param_changed,
    .process       = capture_on_process,
};

const auto playback_stream_events = pw_stream_events{
    .version       = PW_VERSION_STREAM_EVENTS,
    .state_changed = on_state_changed,
    .param_changed = on_param_changed,
    .process       = playback_on_process,
};

struct PipeWireBackend : Backend {
    AutoPWThreadLoop loop;

    auto init() -> bool;
    auto connect_stream(std::unique_ptr<PipeWireStream> self, const char* name, const char* category, const pw_stream_events& events, uint32_t rate, spa_direction direction) -> std::unique_ptr<Stream>;

    auto open_capture(uint32_t rate, CaptureCallback on_samples, FailureCallback on_failure) -> std::unique_ptr<Stream> override;
    auto open_playback(uint32_t rate, PlaybackCallback on_request, FailureCallback on_failure) -> std::unique_ptr<Stream> override;

    ~PipeWireBackend() override;
};

auto PipeWireBackend::init() -> bool {
    pw_init(NULL, NULL);
    loop = AutoPWThreadLoop(pw_thread_loop_new("vocalink-audio", NULL));
    ensure(loop);
    const auto ret = pw_thread_loop_start(loop.get());
    ensure(ret >= 0, "failed to start pipewire loop: {}", spa_strerror(ret));
    return true;
}

auto PipeWireBackend::connect_stream(std::unique_ptr<PipeWireStream> self,
                                     const char* const              name,
                                     const char* const              category,
                                     const pw_stream_events&        events,
                                     const uint32_t                 rate,
                                     const spa_direction            direction) -> std::unique_ptr<Stream> {
    pw_thread_loop_lock(loop.get());
    auto cleaner = Cleaner{[this] { pw_thread_loop_unlock(loop.get()); }};

    auto props = AutoPWProperties(pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, category,
        PW_KEY_MEDIA_ROLE, "Communication",
        NULL));
    ensure(props);

    self->loop = loop.get();
    self->name = name;
    self->rate = rate;
    // pw_stream_new_simple takes ownership of props
    self->stream = AutoPWStream(pw_stream_new_simple(pw_thread_loop_get_loop(loop.get()), name, props.release(), &events, self.get()));
    ensure(self->stream, "failed to create {} stream", name);

    // "The POD start is always aligned to 8 bytes."
    alignas(8) auto pod_builder_buffer = std::array<std::byte, 1024>();
    auto            pod_builder        = spa_pod_builder{.data = pod_builder_buffer.data(), .size = pod_builder_buffer.size()};

    auto format = spa_audio_info_raw{.format = SPA_AUDIO_FORMAT_F32, .rate = rate, .channels = 1};
    format.position[0] = SPA_AUDIO_CHANNEL_MONO;

    const auto params = std::array{
        spa_format_audio_raw_build(&pod_builder, SPA_PARAM_EnumFormat, &format),
    };

    const auto ret = pw_stream_connect(self->stream.get(),
                                       direction,
                                       PW_ID_ANY,
                                       pw_stream_flags(PW_STREAM_FLAG_AUTOCONNECT |
                                                       PW_STREAM_FLAG_MAP_BUFFERS |
                                                       PW_STREAM_FLAG_RT_PROCESS),
                                       (const spa_pod**)params.data(), params.size());
    ensure(ret == 0, "failed to connect {} stream: {}", name, spa_strerror(ret));
    LOG_INFO(logger, "opened {} stream rate={}", name, rate);
    return self;
}

auto PipeWireBackend::open_capture(const uint32_t rate, CaptureCallback on_samples, FailureCallback on_failure) -> std::unique_ptr<Stream> {
    auto self        = std::make_unique<PipeWireStream>();
    self->on_samples = std::move(on_samples);
    self->on_failure = std::move(on_failure);
    return connect_stream(std::move(self), "vocalink-capture", "Capture", capture_stream_events, rate, SPA_DIRECTION_INPUT);
}

auto PipeWireBackend::open_playback(const uint32_t rate, PlaybackCallback on_request, FailureCallback on_failure) -> std::unique_ptr<Stream> {
    auto self        = std::make_unique<PipeWireStream>();
    self->on_request = std::move(on_request);
    self->on_failure = std::move(on_failure);
    return connect_stream(std::move(self), "vocalink-playback", "Playback", playback_stream_events, rate, SPA_DIRECTION_OUTPUT);
}

PipeWireBackend::~PipeWireBackend() {
    if(loop) {
        pw_thread_loop_stop(loop.get());
        loop.reset();
    }
    pw_deinit();
}
} // namespace

auto create_pipewire_backend() -> std::unique_ptr<Backend> {
    auto backend = std::make_unique<PipeWireBackend>();
    ensure(backend->init());
    return backend;
}
} // namespace sound
