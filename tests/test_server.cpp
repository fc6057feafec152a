#include "test_server.hpp"

#include "retry_http/logger.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <memory>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace retry_http {
namespace testing {

namespace {

std::string str(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// ---------------------------------------------------------------------------
// One connection; serves requests until the peer goes away.
// ---------------------------------------------------------------------------

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, TestServer& server)
        : mStream(std::move(socket))
        , mTimer(mStream.get_executor())
        , mServer(server) {}

    void run() { doRead(); }

private:
    void doRead() {
        mRequest = {};
        http::async_read(mStream, mBuffer, mRequest,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            doClose();
            return;
        }

        RecordedCall call;
        call.method = str(mRequest.method_string());
        call.target = str(mRequest.target());
        call.path   = call.target.substr(0, call.target.find('?'));
        call.body   = mRequest.body();
        for (auto const& field : mRequest) {
            call.headers.add(str(field.name_string()), str(field.value()));
        }

        TestServer::Reply reply = mServer.record(std::move(call));

        mResponse = {};
        mResponse.version(mRequest.version());
        mResponse.result(reply.status);
        mResponse.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        mResponse.set(http::field::content_type, kTextContentType);
        mResponse.keep_alive(mRequest.keep_alive());
        if (mRequest.method() != http::verb::head) {
            mResponse.body() = std::move(reply.body);
        }
        mResponse.prepare_payload();

        if (reply.delay.count() > 0) {
            mTimer.expires_after(reply.delay);
            mTimer.async_wait(beast::bind_front_handler(&Session::onDelay, shared_from_this()));
            return;
        }
        doWrite();
    }

    void onDelay(beast::error_code ec) {
        if (ec) {
            doClose();
            return;
        }
        doWrite();
    }

    void doWrite() {
        http::async_write(mStream, mResponse,
                          beast::bind_front_handler(&Session::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        // The client may have given up while the response was held back
        if (ec || !mResponse.keep_alive()) {
            doClose();
            return;
        }
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        mStream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream mStream;
    beast::flat_buffer mBuffer;
    net::steady_timer mTimer;
    http::request<http::string_body> mRequest;
    http::response<http::string_body> mResponse;
    TestServer& mServer;
};

} // namespace

// ---------------------------------------------------------------------------
// TestServer
// ---------------------------------------------------------------------------

TestServer::TestServer(unsigned status)
    : mAcceptor(mIoc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    , mStatus(status)
{
    mUrl = "http://127.0.0.1:" + std::to_string(mAcceptor.local_endpoint().port());
    doAccept();
    mThread = std::thread([this]() { mIoc.run(); });
    RETRY_HTTP_LOG_DEBUG("test server listening on " + mUrl);
}

TestServer::~TestServer() {
    close();
}

void TestServer::close() {
    {
        std::lock_guard<std::mutex> lk(mMutex);
        if (mClosed) {
            return;
        }
        mClosed = true;
    }
    mIoc.stop();
    if (mThread.joinable()) {
        mThread.join();
    }
}

void TestServer::doAccept() {
    mAcceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            RETRY_HTTP_LOG_WARN("test server accept failed: " + ec.message());
            return;
        }
        std::make_shared<Session>(std::move(socket), *this)->run();
        doAccept();
    });
}

void TestServer::delayOnCall(int call, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mMutex);
    mDelays[call] = delay;
}

void TestServer::statusOnCall(int call, unsigned status) {
    std::lock_guard<std::mutex> lk(mMutex);
    mStatusOverrides[call] = status;
}

int TestServer::callCount() const {
    std::lock_guard<std::mutex> lk(mMutex);
    return static_cast<int>(mCalls.size());
}

std::vector<RecordedCall> TestServer::calls() const {
    std::lock_guard<std::mutex> lk(mMutex);
    return mCalls;
}

TestServer::Reply TestServer::record(RecordedCall call) {
    std::lock_guard<std::mutex> lk(mMutex);
    call.callCount = static_cast<int>(mCalls.size()) + 1;

    Reply reply;
    reply.status = mStatus;
    if (auto it = mStatusOverrides.find(call.callCount); it != mStatusOverrides.end()) {
        reply.status = it->second;
    }
    if (auto it = mDelays.find(call.callCount); it != mDelays.end()) {
        reply.delay = it->second;
    }
    reply.body = call.method + " " + call.path + " call=" + std::to_string(call.callCount);

    RETRY_HTTP_LOG_DEBUG("test server: " + reply.body + " -> " + std::to_string(reply.status));
    mCalls.push_back(std::move(call));
    return reply;
}

} // namespace testing
} // namespace retry_http
