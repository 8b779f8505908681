#include "../src/ipc/control_rep.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <chrono>
#include <zmq.h>

/**
 * @brief Test ControlRep functionality
 *
 * Tests the REQ/REP pattern by creating a test client that sends
 * a command and verifies the reply is received.
 */
int main() {
    std::cout << "Testing ControlRep functionality..." << std::endl;

    const std::string endpoint = "tcp://127.0.0.1:5575";

    try {
        // Test 1: Bind and polling without a client
        {
            std::cout << "Test 1: Bind" << std::endl;
            ControlRep rep(endpoint);
            assert(rep.is_connected());
            assert(rep.get_bind_address() == endpoint);
            assert(!rep.has_request());
            assert(!rep.has_request(10));
            std::cout << "  ControlRep bound to " << endpoint << std::endl;
        }

        // Test 2: Bind failure is reported, not thrown
        {
            std::cout << "Test 2: Invalid endpoint" << std::endl;
            ControlRep rep("invalid://endpoint");
            assert(!rep.is_connected());
            assert(!rep.last_error.empty());
            std::cout << "  Error: " << rep.last_error << std::endl;
        }

        // Test 3: Request/reply
        {
            std::cout << "Test 3: Request/reply" << std::endl;
            ControlRep rep(endpoint);
            assert(rep.is_connected());

            std::atomic<bool> client_ok{false};
            std::thread client_thread([&]() {
                void* ctx = zmq_ctx_new();
                void* req = zmq_socket(ctx, ZMQ_REQ);
                int linger = 0;
                zmq_setsockopt(req, ZMQ_LINGER, &linger, sizeof(linger));
                int timeout = 5000;
                zmq_setsockopt(req, ZMQ_RCVTIMEO, &timeout, sizeof(timeout));
                if (zmq_connect(req, endpoint.c_str()) == 0) {
                    std::string cmd = R"({"target":"FeedPumpPump","value":true})";
                    zmq_send(req, cmd.data(), cmd.size(), 0);

                    char buf[1024];
                    int n = zmq_recv(req, buf, sizeof(buf), 0);
                    if (n > 0) {
                        std::string response(buf, buf + n);
                        std::cout << "  Client received: " << response << std::endl;
                        client_ok = response == R"({"ok":true,"consumed":true})";
                    }
                }
                zmq_close(req);
                zmq_ctx_term(ctx);
            });

            assert(rep.has_request(5000));
            std::string cmd = rep.recv();
            std::cout << "  Server received: " << cmd << std::endl;
            assert(cmd == R"({"target":"FeedPumpPump","value":true})");
            assert(rep.reply(R"({"ok":true,"consumed":true})"));

            client_thread.join();
            assert(client_ok.load());
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "All ControlRep tests passed!" << std::endl;
    return 0;
}
