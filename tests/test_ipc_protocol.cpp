#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/tabdock_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll briefly for data to arrive.
ReadStatus read_with_retry(UnixSocketServer& server, int fd, json& out) {
    ReadStatus status = ReadStatus::Incomplete;
    for (int i = 0; i < 100; ++i) {
        status = server.read_command(fd, out);
        if (status != ReadStatus::Incomplete) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return status;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("ClientConnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd = {{"cmd", "list_session_windows"}};
        REQUIRE(client.send(cmd));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Message);
        REQUIRE(received["cmd"] == "list_session_windows");

        json resp = {{"status", "ok"}, {"windows", json::array({"session-window-1"})}};
        REQUIRE(server.send_response(client_fd, resp));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["windows"][0] == "session-window-1");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("NothingSentIsIncomplete") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Incomplete);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("TwoLinesInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"seq", 1}}));
        REQUIRE(client.send({{"seq", 2}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        json first;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadStatus::Message);
        REQUIRE(first["seq"] == 1);

        json second;
        REQUIRE(read_with_retry(server, client_fd, second) == ReadStatus::Message);
        REQUIRE(second["seq"] == 2);
        REQUIRE_FALSE(server.has_pending(client_fd));

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("EventStream") {
        // Several pushes queued before the client reads all come through.
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(server.send_response(client_fd, {{"event", "tick"}, {"seq", i}}));
        }

        for (int i = 0; i < 5; ++i) {
            json ev;
            REQUIRE(client.recv(ev, 1000));
            REQUIRE(ev["seq"] == i);
        }

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MalformedLineCloses") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        // Raw socket: the client class only ever writes valid JSON.
        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string garbage = "{not json\n";
        REQUIRE(::send(raw, garbage.data(), garbage.size(), 0) ==
                static_cast<ssize_t>(garbage.size()));

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);

        server.close_client(client_fd);
        ::close(raw);
        server.stop();
    }

    SECTION("SlowListenerGetsWholeLines") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Push large events until the socket stops taking them whole.
        std::string big(100 * 1024, 'x');
        int sent = 0;
        while (!server.has_output(client_fd) && sent < 200) {
            REQUIRE(server.send_response(client_fd, {{"seq", sent}, {"payload", big}}));
            ++sent;
        }
        REQUIRE(server.has_output(client_fd));

        // Queued behind the partial line, not spliced into it.
        REQUIRE(server.send_response(client_fd, {{"seq", sent}, {"payload", "small"}}));
        ++sent;

        bool flushed = true;
        std::thread flusher([&] {
            while (flushed && server.has_output(client_fd)) {
                flushed = server.flush(client_fd);
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });

        std::vector<int> seqs;
        for (int i = 0; i < sent; ++i) {
            json ev;
            if (!client.recv(ev, 2000)) break;
            seqs.push_back(ev["seq"].get<int>());
        }
        // Unblocks the flusher if reading stopped early.
        client.close();
        flusher.join();

        REQUIRE(flushed);
        REQUIRE(seqs.size() == static_cast<size_t>(sent));
        for (int i = 0; i < sent; ++i) {
            REQUIRE(seqs[i] == i);
        }

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("StalledListenerIsCutOff") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string big(100 * 1024, 'x');
        bool accepted = true;
        for (int i = 0; i < 200 && accepted; ++i) {
            accepted = server.send_response(client_fd, {{"seq", i}, {"payload", big}});
        }
        REQUIRE_FALSE(accepted);
        REQUIRE_FALSE(server.has_output(client_fd));

        // The server side now reads EOF so the loop drops the client.
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Closed);

        // Whatever reached the client is still whole lines.
        json ev;
        int seq = 0;
        while (client.recv(ev, 200)) {
            REQUIRE(ev["seq"] == seq);
            ++seq;
        }

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }
}
