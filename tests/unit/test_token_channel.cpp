#include <catch2/catch_test_macros.hpp>

#include "runtime/token_channel.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace threadrunner;

TEST_CASE("TokenChannel delivers messages in order", "[token_channel]") {
  TokenChannel channel(4);
  REQUIRE(channel.Capacity() == 4);
  REQUIRE(channel.Send(std::string("a")));
  REQUIRE(channel.Send(std::string("b")));
  REQUIRE(channel.Send(std::nullopt));
  REQUIRE(channel.Size() == 3);

  std::optional<std::string> message;
  REQUIRE(channel.Receive(&message));
  REQUIRE(message == std::optional<std::string>("a"));
  REQUIRE(channel.Receive(&message));
  REQUIRE(message == std::optional<std::string>("b"));
  REQUIRE(channel.Receive(&message));
  REQUIRE_FALSE(message.has_value());
}

TEST_CASE("TokenChannel applies backpressure when full", "[token_channel]") {
  TokenChannel channel(2);
  std::atomic<int> sent{0};
  std::thread producer([&] {
    for (int i = 0; i < 5; ++i) {
      if (!channel.Send(std::to_string(i))) {
        return;
      }
      ++sent;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(sent.load() == 2);

  std::vector<std::string> received;
  std::optional<std::string> message;
  while (received.size() < 5 && channel.Receive(&message)) {
    received.push_back(*message);
  }
  producer.join();
  REQUIRE(received == std::vector<std::string>{"0", "1", "2", "3", "4"});
}

TEST_CASE("Closing wakes a blocked sender", "[token_channel]") {
  TokenChannel channel(1);
  REQUIRE(channel.Send(std::string("fill")));
  std::atomic<bool> result{true};
  std::thread producer([&] { result = channel.Send(std::string("blocked")); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.Close();
  producer.join();
  REQUIRE_FALSE(result.load());
  REQUIRE(channel.Closed());
}

TEST_CASE("Receive drains queued messages before reporting closure",
          "[token_channel]") {
  TokenChannel channel(4);
  REQUIRE(channel.Send(std::string("last")));
  channel.Close();
  REQUIRE_FALSE(channel.Send(std::string("late")));

  std::optional<std::string> message;
  REQUIRE(channel.Receive(&message));
  REQUIRE(message == std::optional<std::string>("last"));
  REQUIRE_FALSE(channel.Receive(&message));
}

TEST_CASE("Closing wakes a blocked receiver", "[token_channel]") {
  TokenChannel channel(4);
  std::atomic<bool> result{true};
  std::thread consumer([&] {
    std::optional<std::string> message;
    result = channel.Receive(&message);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.Close();
  consumer.join();
  REQUIRE_FALSE(result.load());
}
