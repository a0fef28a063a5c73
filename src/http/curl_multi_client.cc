#include "mcplink/http/curl_multi_client.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>
#include <vector>

#define MCPLINK_LOG_COMPONENT "http.curl"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace http {

namespace {

std::once_flag curl_init_once;

void ensureCurlInitialized() {
  // Process lifetime; never cleaned up because other users may share it
  std::call_once(curl_init_once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string trim(const std::string& str) {
  size_t first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  size_t last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

}  // namespace

const char* toString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::DELETE:
      return "DELETE";
  }
  return "GET";
}

optional<std::string> HttpResponse::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  if (it == headers.end()) {
    return nullopt;
  }
  return it->second;
}

class CurlMultiClient::Impl {
 public:
  Impl(event::Dispatcher& dispatcher, const Config& config)
      : dispatcher_(dispatcher), config_(config) {
    ensureCurlInitialized();

    multi_ = curl_multi_init();
    if (!multi_) {
      throw std::runtime_error("curl_multi_init failed");
    }
    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &Impl::socketCallback);
    curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &Impl::timerCallback);
    curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);

    timer_ = dispatcher_.createTimer([this]() {
      socketAction(CURL_SOCKET_TIMEOUT, 0);
    });
    // Socket events retired by curl are freed here, outside their callbacks
    reaper_ = dispatcher_.createTimer([this]() { retired_.clear(); });
    failure_timer_ = dispatcher_.createTimer([this]() { deliverFailures(); });
  }

  ~Impl() {
    timer_->disableTimer();
    failure_timer_->disableTimer();
    failed_.clear();
    for (auto& entry : transfers_) {
      Transfer& transfer = *entry.second;
      if (transfer.added) {
        curl_multi_remove_handle(multi_, transfer.easy);
        transfer.added = false;
      }
    }
    transfers_.clear();
    curl_multi_cleanup(multi_);
    sockets_.clear();
    retired_.clear();
  }

  TransferId start(const HttpRequest& request,
                   ResponseCallback callback,
                   StreamCallbacks stream_callbacks,
                   bool streaming) {
    auto transfer = std::make_unique<Transfer>();
    transfer->id = next_id_++;
    transfer->owner = this;
    transfer->streaming = streaming;
    transfer->callback = std::move(callback);
    transfer->stream_callbacks = std::move(stream_callbacks);
    transfer->body = request.body;
    transfer->started = std::chrono::steady_clock::now();

    transfer->easy = curl_easy_init();
    if (!transfer->easy) {
      const TransferId id = transfer->id;
      HttpResponse response;
      response.error = "Failed to initialize CURL";
      failLater(std::move(transfer), std::move(response));
      return id;
    }
    configure(*transfer, request);

    const TransferId id = transfer->id;
    MCPLINK_LOG_DEBUG("#{} {} {}", id, toString(request.method), request.url);
    Transfer* raw = transfer.get();
    transfers_.emplace(id, std::move(transfer));

    // curl rejects re-entrant calls from inside its own callbacks
    if (curl_depth_ > 0) {
      pending_adds_.push_back(id);
    } else {
      addHandle(*raw);
    }
    return id;
  }

  void cancel(TransferId id) {
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
      failed_.erase(id);
      return;
    }
    Transfer& transfer = *it->second;
    transfer.cancelled = true;
    transfer.callback = nullptr;
    transfer.stream_callbacks = StreamCallbacks();

    if (curl_depth_ > 0) {
      doomed_.push_back(id);
      return;
    }
    removeTransfer(id);
  }

  size_t activeTransfers() const { return transfers_.size(); }

 private:
  struct Transfer {
    ~Transfer() {
      if (easy) {
        curl_easy_cleanup(easy);
      }
      if (header_list) {
        curl_slist_free_all(header_list);
      }
    }

    TransferId id{0};
    Impl* owner{nullptr};
    CURL* easy{nullptr};
    curl_slist* header_list{nullptr};
    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    bool streaming{false};
    bool added{false};
    bool cancelled{false};
    bool headers_delivered{false};

    ResponseCallback callback;
    StreamCallbacks stream_callbacks;
    HttpResponse response;
    std::chrono::steady_clock::time_point started;
  };

  using TransferPtr = std::unique_ptr<Transfer>;

  void configure(Transfer& transfer, const HttpRequest& request) {
    CURL* curl = transfer.easy;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_PRIVATE, &transfer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer.error_buffer);

    switch (request.method) {
      case HttpMethod::GET:
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        break;
      case HttpMethod::POST:
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        break;
      case HttpMethod::DELETE:
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
        break;
    }

    if (request.method == HttpMethod::POST) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, transfer.body.data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(transfer.body.size()));
    }

    for (const auto& header : request.headers) {
      std::string line = header.first + ": " + header.second;
      transfer.header_list = curl_slist_append(transfer.header_list,
                                               line.c_str());
    }
    // No 100-continue round trip for JSON bodies
    transfer.header_list = curl_slist_append(transfer.header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer.header_list);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION,
                     request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));
    if (request.timeout.count() > 0) {
      curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                       static_cast<long>(request.timeout.count()));
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
  }

  void addHandle(Transfer& transfer) {
    CURLMcode rc = curl_multi_add_handle(multi_, transfer.easy);
    if (rc != CURLM_OK) {
      HttpResponse response;
      response.error = curl_multi_strerror(rc);
      auto it = transfers_.find(transfer.id);
      TransferPtr owned = std::move(it->second);
      transfers_.erase(it);
      failLater(std::move(owned), std::move(response));
      return;
    }
    transfer.added = true;
  }

  // Failures detected before curl owns the transfer still complete
  // asynchronously, like any other result
  void failLater(TransferPtr transfer, HttpResponse response) {
    MCPLINK_LOG_ERROR("#{} failed to start: {}", transfer->id, response.error);
    const TransferId id = transfer->id;
    failed_.emplace(id,
                    std::make_pair(std::move(transfer), std::move(response)));
    failure_timer_->enableTimer(std::chrono::milliseconds(0));
  }

  void deliverFailures() {
    while (!failed_.empty()) {
      auto it = failed_.begin();
      auto entry = std::move(it->second);
      failed_.erase(it);
      complete(*entry.first, std::move(entry.second));
    }
  }

  void removeTransfer(TransferId id) {
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
      return;
    }
    TransferPtr transfer = std::move(it->second);
    transfers_.erase(it);
    if (transfer->added) {
      curl_multi_remove_handle(multi_, transfer->easy);
      transfer->added = false;
    }
    MCPLINK_LOG_DEBUG("#{} cancelled", id);
  }

  void socketAction(curl_socket_t fd, int action) {
    int running = 0;
    ++curl_depth_;
    CURLMcode rc = curl_multi_socket_action(multi_, fd, action, &running);
    --curl_depth_;
    if (rc != CURLM_OK) {
      MCPLINK_LOG_ERROR("curl_multi_socket_action: {}", curl_multi_strerror(rc));
    }
    afterAction();
  }

  void afterAction() {
    std::vector<TransferId> doomed;
    doomed.swap(doomed_);
    for (TransferId id : doomed) {
      removeTransfer(id);
    }

    processCompleted();

    std::vector<TransferId> adds;
    adds.swap(pending_adds_);
    for (TransferId id : adds) {
      auto it = transfers_.find(id);
      if (it != transfers_.end() && !it->second->cancelled) {
        addHandle(*it->second);
      }
    }
  }

  void processCompleted() {
    CURLMsg* msg = nullptr;
    int remaining = 0;
    while ((msg = curl_multi_info_read(multi_, &remaining)) != nullptr) {
      if (msg->msg != CURLMSG_DONE) {
        continue;
      }
      CURL* easy = msg->easy_handle;
      CURLcode result = msg->data.result;

      char* priv = nullptr;
      curl_easy_getinfo(easy, CURLINFO_PRIVATE, &priv);
      auto* raw = reinterpret_cast<Transfer*>(priv);
      if (!raw) {
        continue;
      }
      auto it = transfers_.find(raw->id);
      if (it == transfers_.end()) {
        continue;
      }
      TransferPtr transfer = std::move(it->second);
      transfers_.erase(it);
      curl_multi_remove_handle(multi_, easy);
      transfer->added = false;

      if (transfer->cancelled) {
        continue;
      }

      HttpResponse response = std::move(transfer->response);
      long status = 0;
      curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
      response.status_code = status;
      if (result != CURLE_OK) {
        response.error = transfer->error_buffer[0] != '\0'
                             ? std::string(transfer->error_buffer)
                             : std::string(curl_easy_strerror(result));
      }
      complete(*transfer, std::move(response));
    }
  }

  void complete(Transfer& transfer, HttpResponse response) {
    response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - transfer.started);

    if (response.error.empty()) {
      MCPLINK_LOG_DEBUG("#{} done: HTTP {} in {}ms", transfer.id,
                        response.status_code, response.latency.count());
    } else {
      MCPLINK_LOG_DEBUG("#{} failed: {}", transfer.id, response.error);
    }

    if (transfer.streaming) {
      auto on_complete = std::move(transfer.stream_callbacks.on_complete);
      if (on_complete) {
        on_complete(std::move(response));
      }
    } else {
      auto callback = std::move(transfer.callback);
      if (callback) {
        callback(std::move(response));
      }
    }
  }

  void onSocketReady(curl_socket_t fd, uint32_t events) {
    int action = 0;
    if (events & (static_cast<uint32_t>(event::FileReadyType::Read) |
                  static_cast<uint32_t>(event::FileReadyType::Closed))) {
      action |= CURL_CSELECT_IN;
    }
    if (events & static_cast<uint32_t>(event::FileReadyType::Write)) {
      action |= CURL_CSELECT_OUT;
    }
    if (events & static_cast<uint32_t>(event::FileReadyType::Error)) {
      action |= CURL_CSELECT_ERR;
    }
    socketAction(fd, action);
  }

  void watchSocket(curl_socket_t fd, int what) {
    if (what == CURL_POLL_REMOVE) {
      auto it = sockets_.find(fd);
      if (it != sockets_.end()) {
        // May be running inside this socket's own callback
        it->second->setEnabled(0);
        retired_.push_back(std::move(it->second));
        sockets_.erase(it);
        reaper_->enableTimer(std::chrono::milliseconds(0));
      }
      return;
    }

    uint32_t events = 0;
    if (what == CURL_POLL_IN || what == CURL_POLL_INOUT) {
      events |= static_cast<uint32_t>(event::FileReadyType::Read);
    }
    if (what == CURL_POLL_OUT || what == CURL_POLL_INOUT) {
      events |= static_cast<uint32_t>(event::FileReadyType::Write);
    }

    auto it = sockets_.find(fd);
    if (it != sockets_.end()) {
      it->second->setEnabled(events);
      return;
    }
    sockets_.emplace(
        fd, dispatcher_.createFileEvent(
                fd, [this, fd](uint32_t ready) { onSocketReady(fd, ready); },
                event::FileTriggerType::Level, events));
  }

  void armTimer(long timeout_ms) {
    if (timeout_ms < 0) {
      timer_->disableTimer();
      return;
    }
    timer_->enableTimer(std::chrono::milliseconds(timeout_ms));
  }

  static int socketCallback(CURL* /*easy*/,
                            curl_socket_t fd,
                            int what,
                            void* userp,
                            void* /*socketp*/) {
    static_cast<Impl*>(userp)->watchSocket(fd, what);
    return 0;
  }

  static int timerCallback(CURLM* /*multi*/, long timeout_ms, void* userp) {
    static_cast<Impl*>(userp)->armTimer(timeout_ms);
    return 0;
  }

  static size_t headerCallback(char* buffer,
                               size_t size,
                               size_t nitems,
                               void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const size_t length = size * nitems;
    std::string line(buffer, length);

    // A new status line starts a new response (redirects, 100 Continue)
    if (line.compare(0, 5, "HTTP/") == 0) {
      transfer->response.headers.clear();
      return length;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos != std::string::npos) {
      std::string name = toLower(trim(line.substr(0, colon_pos)));
      if (!name.empty()) {
        transfer->response.headers[name] = trim(line.substr(colon_pos + 1));
      }
    }
    return length;
  }

  static size_t writeCallback(char* ptr,
                              size_t size,
                              size_t nmemb,
                              void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const size_t length = size * nmemb;

    if (transfer->cancelled) {
      return 0;
    }

    if (!transfer->streaming) {
      transfer->response.body.append(ptr, length);
      return length;
    }

    if (!transfer->headers_delivered) {
      transfer->headers_delivered = true;
      long status = 0;
      curl_easy_getinfo(transfer->easy, CURLINFO_RESPONSE_CODE, &status);
      transfer->response.status_code = status;
      if (transfer->stream_callbacks.on_headers) {
        transfer->stream_callbacks.on_headers(transfer->response);
      }
      if (transfer->cancelled) {
        return 0;
      }
    }

    if (transfer->stream_callbacks.on_data) {
      transfer->stream_callbacks.on_data(ptr, length);
    }
    // Returning short aborts the transfer
    return transfer->cancelled ? 0 : length;
  }

  event::Dispatcher& dispatcher_;
  Config config_;
  CURLM* multi_{nullptr};
  event::TimerPtr timer_;
  event::TimerPtr reaper_;
  event::TimerPtr failure_timer_;

  std::unordered_map<curl_socket_t, event::FileEventPtr> sockets_;
  std::vector<event::FileEventPtr> retired_;

  std::unordered_map<TransferId, TransferPtr> transfers_;
  std::unordered_map<TransferId, std::pair<TransferPtr, HttpResponse>> failed_;
  std::vector<TransferId> pending_adds_;
  std::vector<TransferId> doomed_;
  TransferId next_id_{1};
  int curl_depth_{0};
};

CurlMultiClient::CurlMultiClient(event::Dispatcher& dispatcher,
                                 const Config& config)
    : impl_(std::make_unique<Impl>(dispatcher, config)) {}

CurlMultiClient::~CurlMultiClient() = default;

CurlMultiClient::TransferId CurlMultiClient::send(const HttpRequest& request,
                                                  ResponseCallback callback) {
  return impl_->start(request, std::move(callback), StreamCallbacks(), false);
}

CurlMultiClient::TransferId CurlMultiClient::stream(const HttpRequest& request,
                                                    StreamCallbacks callbacks) {
  return impl_->start(request, nullptr, std::move(callbacks), true);
}

void CurlMultiClient::cancel(TransferId id) { impl_->cancel(id); }

size_t CurlMultiClient::activeTransfers() const {
  return impl_->activeTransfers();
}

}  // namespace http
}  // namespace mcplink
