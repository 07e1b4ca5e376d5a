// Copyright 2026 The multicap Authors
// Linux audio device backend -- PulseAudio threaded mainloop + context
// subscription.

#include "core/audio_device_backend.h"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "core/logger.h"

#include <pulse/pulseaudio.h>

namespace multicap {
namespace internal {

namespace {

constexpr char kApplicationName[] = "multicap";
constexpr auto kConnectTimeout = std::chrono::seconds(5);

}  // namespace

class PulseDeviceBackend : public AudioDeviceBackend {
 public:
  PulseDeviceBackend() = default;

  ~PulseDeviceBackend() override {
    Unsubscribe();
    Shutdown();
  }

  bool Initialize() {
    mainloop_ = pa_threaded_mainloop_new();
    if (!mainloop_) {
      MULTICAP_LOG_ERROR("pa_threaded_mainloop_new failed");
      return false;
    }
    context_ = pa_context_new(pa_threaded_mainloop_get_api(mainloop_),
                              kApplicationName);
    if (!context_) {
      MULTICAP_LOG_ERROR("pa_context_new failed");
      Shutdown();
      return false;
    }
    pa_context_set_state_callback(context_, &PulseDeviceBackend::OnContextState,
                                  this);

    if (pa_threaded_mainloop_start(mainloop_) < 0) {
      MULTICAP_LOG_ERROR("pa_threaded_mainloop_start failed");
      Shutdown();
      return false;
    }

    pa_threaded_mainloop_lock(mainloop_);
    bool ready = false;
    if (pa_context_connect(context_, nullptr, PA_CONTEXT_NOFLAGS, nullptr) >=
        0) {
      auto deadline = std::chrono::steady_clock::now() + kConnectTimeout;
      for (;;) {
        pa_context_state_t state = pa_context_get_state(context_);
        if (state == PA_CONTEXT_READY) {
          ready = true;
          break;
        }
        if (!PA_CONTEXT_IS_GOOD(state) ||
            std::chrono::steady_clock::now() > deadline) {
          break;
        }
        pa_threaded_mainloop_wait(mainloop_);
      }
    }
    if (!ready) {
      MULTICAP_LOG_WARN("PulseAudio server unavailable: {}",
                        pa_strerror(pa_context_errno(context_)));
    }
    pa_threaded_mainloop_unlock(mainloop_);

    if (!ready) {
      Shutdown();
      return false;
    }
    return true;
  }

  bool GetDefaultDeviceId(DeviceSide side, std::string* out_id) override {
    if (!out_id) return false;
    ServerDefaults defaults;
    if (!QueryServerInfo(&defaults)) return false;
    *out_id = side == DeviceSide::kInput ? defaults.source : defaults.sink;
    return !out_id->empty();
  }

  bool GetDefaultDeviceInfo(DeviceSide side,
                            AudioDeviceInfo* out_info) override {
    if (!out_info) return false;
    std::string id;
    if (!GetDefaultDeviceId(side, &id)) return false;

    DeviceQuery query;
    query.backend = this;
    query.info.id = id;

    pa_threaded_mainloop_lock(mainloop_);
    pa_operation* op =
        side == DeviceSide::kInput
            ? pa_context_get_source_info_by_name(
                  context_, id.c_str(), &PulseDeviceBackend::OnSourceInfo,
                  &query)
            : pa_context_get_sink_info_by_name(
                  context_, id.c_str(), &PulseDeviceBackend::OnSinkInfo,
                  &query);
    bool ok = WaitOperationLocked(op);
    pa_threaded_mainloop_unlock(mainloop_);

    if (!ok || !query.found) return false;
    *out_info = query.info;
    return true;
  }

  bool Subscribe(ChangeCallback callback) override {
    if (!context_) return false;
    Unsubscribe();

    {
      std::lock_guard<std::mutex> lock(notify_mutex_);
      callback_ = std::move(callback);
      notify_pending_ = false;
      notify_running_ = true;
    }
    // Callbacks run off the mainloop thread so they may query the server.
    notify_thread_ = std::thread(&PulseDeviceBackend::NotifyLoop, this);

    pa_threaded_mainloop_lock(mainloop_);
    pa_context_set_subscribe_callback(
        context_, &PulseDeviceBackend::OnSubscriptionEvent, this);
    pa_operation* op = pa_context_subscribe(
        context_, PA_SUBSCRIPTION_MASK_SERVER, nullptr, nullptr);
    bool ok = op != nullptr;
    if (op) pa_operation_unref(op);
    pa_threaded_mainloop_unlock(mainloop_);

    if (!ok) {
      MULTICAP_LOG_WARN("PulseAudio subscription failed");
      Unsubscribe();
    }
    return ok;
  }

  void Unsubscribe() override {
    if (context_) {
      pa_threaded_mainloop_lock(mainloop_);
      pa_context_set_subscribe_callback(context_, nullptr, nullptr);
      pa_operation* op = pa_context_subscribe(
          context_, PA_SUBSCRIPTION_MASK_NULL, nullptr, nullptr);
      if (op) pa_operation_unref(op);
      pa_threaded_mainloop_unlock(mainloop_);
    }

    {
      std::lock_guard<std::mutex> lock(notify_mutex_);
      notify_running_ = false;
    }
    notify_cv_.notify_all();
    if (notify_thread_.joinable()) notify_thread_.join();

    std::lock_guard<std::mutex> lock(notify_mutex_);
    callback_ = nullptr;
  }

 private:
  struct ServerDefaults {
    PulseDeviceBackend* backend = nullptr;
    std::string sink;
    std::string source;
  };

  struct DeviceQuery {
    PulseDeviceBackend* backend = nullptr;
    AudioDeviceInfo info;
    bool found = false;
  };

  void Shutdown() {
    if (context_) {
      pa_context_disconnect(context_);
    }
    if (mainloop_) {
      pa_threaded_mainloop_stop(mainloop_);
    }
    if (context_) {
      pa_context_unref(context_);
      context_ = nullptr;
    }
    if (mainloop_) {
      pa_threaded_mainloop_free(mainloop_);
      mainloop_ = nullptr;
    }
  }

  bool QueryServerInfo(ServerDefaults* out_defaults) {
    if (!context_) return false;
    out_defaults->backend = this;
    pa_threaded_mainloop_lock(mainloop_);
    pa_operation* op = pa_context_get_server_info(
        context_, &PulseDeviceBackend::OnServerInfo, out_defaults);
    bool ok = WaitOperationLocked(op);
    pa_threaded_mainloop_unlock(mainloop_);
    return ok;
  }

  // Caller holds the mainloop lock.
  bool WaitOperationLocked(pa_operation* op) {
    if (!op) return false;
    while (pa_operation_get_state(op) == PA_OPERATION_RUNNING) {
      pa_threaded_mainloop_wait(mainloop_);
    }
    bool ok = pa_operation_get_state(op) == PA_OPERATION_DONE;
    pa_operation_unref(op);
    return ok;
  }

  void NotifyLoop() {
    std::unique_lock<std::mutex> lock(notify_mutex_);
    while (notify_running_) {
      notify_cv_.wait(lock,
                      [this] { return notify_pending_ || !notify_running_; });
      if (!notify_running_) break;
      notify_pending_ = false;
      ChangeCallback callback = callback_;
      lock.unlock();
      // Server events do not say which default changed.
      if (callback) {
        callback(DeviceSide::kInput);
        callback(DeviceSide::kOutput);
      }
      lock.lock();
    }
  }

  // ----- PulseAudio callbacks (mainloop thread) -----

  static void OnContextState(pa_context* context, void* userdata) {
    (void)context;
    auto* self = static_cast<PulseDeviceBackend*>(userdata);
    pa_threaded_mainloop_signal(self->mainloop_, 0);
  }

  static void OnServerInfo(pa_context* context, const pa_server_info* info,
                           void* userdata) {
    (void)context;
    auto* defaults = static_cast<ServerDefaults*>(userdata);
    if (info) {
      defaults->sink =
          info->default_sink_name ? info->default_sink_name : "";
      defaults->source =
          info->default_source_name ? info->default_source_name : "";
    }
    pa_threaded_mainloop_signal(defaults->backend->mainloop_, 0);
  }

  static void FillInfo(const char* description, const char* driver,
                       pa_proplist* proplist, DeviceQuery* query) {
    query->found = true;
    query->info.name = description ? description : "";
    query->info.driver = driver ? driver : "";
    const char* form_factor =
        proplist ? pa_proplist_gets(proplist, PA_PROP_DEVICE_FORM_FACTOR)
                 : nullptr;
    query->info.form_factor = form_factor ? form_factor : "";
  }

  static void OnSourceInfo(pa_context* context, const pa_source_info* info,
                           int eol, void* userdata) {
    (void)context;
    auto* query = static_cast<DeviceQuery*>(userdata);
    if (eol == 0 && info) {
      FillInfo(info->description, info->driver, info->proplist, query);
    }
    if (eol != 0) pa_threaded_mainloop_signal(query->backend->mainloop_, 0);
  }

  static void OnSinkInfo(pa_context* context, const pa_sink_info* info,
                         int eol, void* userdata) {
    (void)context;
    auto* query = static_cast<DeviceQuery*>(userdata);
    if (eol == 0 && info) {
      FillInfo(info->description, info->driver, info->proplist, query);
    }
    if (eol != 0) pa_threaded_mainloop_signal(query->backend->mainloop_, 0);
  }

  static void OnSubscriptionEvent(pa_context* context,
                                  pa_subscription_event_type_t type,
                                  uint32_t index, void* userdata) {
    (void)context;
    (void)index;
    auto* self = static_cast<PulseDeviceBackend*>(userdata);
    if ((type & PA_SUBSCRIPTION_EVENT_FACILITY_MASK) !=
        PA_SUBSCRIPTION_EVENT_SERVER) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(self->notify_mutex_);
      self->notify_pending_ = true;
    }
    self->notify_cv_.notify_all();
  }

  pa_threaded_mainloop* mainloop_ = nullptr;
  pa_context* context_ = nullptr;

  std::mutex notify_mutex_;
  std::condition_variable notify_cv_;
  ChangeCallback callback_;
  bool notify_pending_ = false;
  bool notify_running_ = false;
  std::thread notify_thread_;
};

std::unique_ptr<AudioDeviceBackend> CreatePlatformAudioDeviceBackend() {
  auto backend = std::make_unique<PulseDeviceBackend>();
  if (!backend->Initialize()) return nullptr;
  return backend;
}

}  // namespace internal
}  // namespace multicap
