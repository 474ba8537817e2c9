//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example sending one STUN Binding request and reporting the response or timeout
//==========================================================================================================

#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/system/system_error.hpp>

#include "stun/Client.h"
#include "stun/version.h"

using namespace stun;

int main(int argc, char** argv) {
    const std::string network = argc > 2 ? argv[2] : "udp";
    const std::string address = argc > 1 ? argv[1] : "stun.l.google.com:19302";
    std::cout << "stun-client " << getVersionString() << " probing " << network << " " << address << "\n";

    std::unique_ptr<Client> client;
    try {
        client = Client::Dial(network, address, ClientOptions::FromConfigString("request_timeout_ms=3000"));
    } catch (const boost::system::system_error& e) {
        std::cerr << "dial failed: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "bad arguments: " << e.what() << "\n";
        return 2;
    }

    Message request;
    request.type = MessageTypes::BindingRequest;
    request.transactionId = TransactionID::Random();

    std::promise<std::string> outcome;
    auto outcomeFuture = outcome.get_future();
    const bool sent = client->Do(request, [&outcome](const Event& e) {
        if (e.IsMatch()) {
            outcome.set_value("response type=0x" + std::format("{:04x}", e.message->type) +
                              " attributes=" + std::to_string(e.message->payload.size()) + " bytes");
        } else {
            outcome.set_value(std::string("no response: ") + toString(e.error));
        }
    });
    if (!sent) {
        std::cerr << "request could not be sent\n";
        client->Close();
        return 1;
    }

    std::cout << "transaction " << request.transactionId.ToHex() << ": " << outcomeFuture.get() << "\n";
    client->Close();
    return 0;
}
