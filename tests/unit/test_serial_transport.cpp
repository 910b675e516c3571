#include "pl-gpib/Errors.hpp"
#include "pl-gpib/Logger.hpp"
#include "pl-gpib/transport/SerialTransport.hpp"

#include <atomic>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <poll.h>
#include <stdlib.h>
#include <thread>
#include <unistd.h>

using namespace plgpib;

// A pseudo-terminal stands in for the adapter: the transport opens the
// slave side, the test plays the adapter on the master side.
class SerialTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    BusLogger::instance().init("test.log", spdlog::level::debug);

    master_ = posix_openpt(O_RDWR | O_NOCTTY);
    ASSERT_GE(master_, 0);
    ASSERT_EQ(grantpt(master_), 0);
    ASSERT_EQ(unlockpt(master_), 0);
    const char *name = ptsname(master_);
    ASSERT_NE(name, nullptr);
    slave_path_ = name;

    transport_ = std::make_unique<SerialTransport>(slave_path_);
    transport_->open();
  }

  void TearDown() override {
    transport_.reset();
    if (master_ >= 0) {
      ::close(master_);
    }
  }

  void adapter_sends(const std::string &data) {
    ASSERT_EQ(::write(master_, data.data(), data.size()),
              static_cast<ssize_t>(data.size()));
  }

  std::string adapter_receives(size_t expected) {
    std::string out;
    char buffer[256];
    while (out.size() < expected) {
      struct pollfd pfd {
        master_, POLLIN, 0
      };
      if (::poll(&pfd, 1, 1000) <= 0) {
        break;
      }
      ssize_t n = ::read(master_, buffer, sizeof(buffer));
      if (n <= 0) {
        break;
      }
      out.append(buffer, static_cast<size_t>(n));
    }
    return out;
  }

  int master_{-1};
  std::string slave_path_;
  std::unique_ptr<SerialTransport> transport_;
};

TEST(SerialTransportOpenTest, MissingDeviceFails) {
  SerialTransport transport("/dev/pl-gpib-does-not-exist");
  EXPECT_THROW(transport.open(), IOError);
  EXPECT_FALSE(transport.is_open());
}

TEST(SerialTransportOpenTest, EmptyTerminatorRejected) {
  SerialOptions options;
  options.terminator = "";
  EXPECT_THROW(SerialTransport("/dev/null", options), IOError);
}

TEST_F(SerialTransportTest, UnsupportedBaudRateFailsOpen) {
  SerialOptions options;
  options.baud_rate = 12345;
  SerialTransport transport(slave_path_, options);
  EXPECT_THROW(transport.open(), IOError);
  EXPECT_FALSE(transport.is_open());
}

TEST_F(SerialTransportTest, WriteAppendsTerminator) {
  EXPECT_TRUE(transport_->is_open());
  EXPECT_EQ(transport_->port_name(), slave_path_);

  transport_->write_line("++ver");
  EXPECT_EQ(adapter_receives(6), "++ver\n");
}

TEST_F(SerialTransportTest, ReadStopsAtTerminator) {
  adapter_sends("one\ntwo\n");

  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(500)), "one\n");
  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(500)), "two\n");
}

TEST_F(SerialTransportTest, ReadStopsAtMaxBytes) {
  adapter_sends("0123456789\n");

  EXPECT_EQ(transport_->read(4, std::chrono::milliseconds(500)), "0123");
  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(500)),
            "456789\n");
}

TEST_F(SerialTransportTest, PartialDataReturnedAtDeadline) {
  adapter_sends("abc");

  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(100)), "abc");
}

TEST_F(SerialTransportTest, NothingArrivingTimesOut) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(transport_->read(100, std::chrono::milliseconds(50)),
               TimeoutError);
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(40));
}

TEST_F(SerialTransportTest, DiscardDropsBufferedAndUnreadBytes) {
  adapter_sends("one\ntwo\n");
  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(500)), "one\n");

  // "two" is now buffered in the transport, "stale" still in the tty
  adapter_sends("stale\n");
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  transport_->discard_input();

  adapter_sends("fresh\n");
  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(500)), "fresh\n");
}

TEST_F(SerialTransportTest, HugeTimeoutStillWaitsForData) {
  std::thread adapter([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    adapter_sends("late\n");
  });

  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(int64_t{1} << 40)),
            "late\n");
  adapter.join();
}

TEST_F(SerialTransportTest, ConcurrentClosesWakeReader) {
  std::atomic<bool> got_io_error{false};
  std::thread reader([&] {
    try {
      transport_->read(100, std::chrono::milliseconds(5000));
    } catch (const IOError &) {
      got_io_error = true;
    }
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  std::vector<std::thread> closers;
  for (int i = 0; i < 4; ++i) {
    closers.emplace_back([this] { transport_->close(); });
  }
  for (auto &t : closers) {
    t.join();
  }
  reader.join();

  EXPECT_TRUE(got_io_error.load());
  EXPECT_FALSE(transport_->is_open());
}

TEST_F(SerialTransportTest, CloseWakesBlockedRead) {
  std::atomic<bool> got_io_error{false};
  std::thread reader([&] {
    try {
      transport_->read(100, std::chrono::milliseconds(5000));
    } catch (const IOError &) {
      got_io_error = true;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto start = std::chrono::steady_clock::now();
  transport_->close();
  reader.join();

  EXPECT_TRUE(got_io_error.load());
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
  EXPECT_FALSE(transport_->is_open());
  EXPECT_THROW(transport_->write_line("*RST"), IOError);
}

TEST_F(SerialTransportTest, ReopenAfterClose) {
  transport_->close();
  transport_->open();
  EXPECT_TRUE(transport_->is_open());

  adapter_sends("1\n");
  EXPECT_EQ(transport_->read(100, std::chrono::milliseconds(500)), "1\n");
}
