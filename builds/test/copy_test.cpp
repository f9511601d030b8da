#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <iostream>
#include <memory_resource>
#include <span>
#include <stdexcept>
#include <thread>
#include <vector>

#include "halt/copy.hpp"
#include "halt/transfer_arena.hpp"
#include "halt.hpp"

using namespace std::chrono_literals;

// Endless stream of zero bytes.
struct zero_reader {
  std::size_t read(std::span<std::byte> buf) {
    std::fill(buf.begin(), buf.end(), std::byte{0});
    return buf.size();
  }
};

// Discards everything, counting the bytes into a counter owned by the test.
struct counting_sink {
  std::atomic<std::uint64_t> *bytes;

  std::size_t write(std::span<const std::byte> buf) {
    bytes->fetch_add(buf.size());
    return buf.size();
  }
};

struct slice_reader {
  std::vector<std::byte> data;
  std::size_t pos = 0;

  std::size_t read(std::span<std::byte> buf) {
    std::size_t n = std::min(buf.size(), data.size() - pos);
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(pos), n, buf.begin());
    pos += n;
    return n;
  }
};

struct trickle_writer {
  std::vector<std::byte> data;

  std::size_t write(std::span<const std::byte> buf) {
    std::size_t n = std::min<std::size_t>(buf.size(), 5);
    data.insert(data.end(), buf.begin(), buf.begin() + n);
    return n;
  }
};

// Records what it is given but claims to have taken more.
struct boasting_writer {
  std::vector<std::byte> data;

  std::size_t write(std::span<const std::byte> buf) {
    data.insert(data.end(), buf.begin(), buf.end());
    return buf.size() + 7;
  }
};

template <typename Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

int main() {
  int failures = 0;

  // Test 1: pause, resume and stop a copy running on another thread
  std::cout << "Test 1: Pause/resume/stop a running copy... ";
  {
    std::atomic<std::uint64_t> counted{0};
    halt::halter reader{zero_reader{}};
    counting_sink sink{&counted};
    auto remote = reader.remote();

    auto copied = std::async(std::launch::async, [&] {
      return halt::copy(reader, sink, {.buffer_size = 4096});
    });

    bool started = wait_until([&] { return counted.load() > 0; }, 2000ms);

    remote.pause();
    std::this_thread::sleep_for(20ms); // let the in-flight chunk land
    std::uint64_t paused_at = counted.load();
    std::this_thread::sleep_for(100ms);
    bool held = counted.load() == paused_at;

    remote.resume();
    bool resumed =
        wait_until([&] { return counted.load() > paused_at; }, 2000ms);

    remote.stop();
    bool finished = copied.wait_for(2s) == std::future_status::ready;
    std::uint64_t total = finished ? copied.get() : 0;
    std::uint64_t stopped_at = counted.load();
    std::this_thread::sleep_for(50ms);
    bool frozen = counted.load() == stopped_at;

    if (started && held && resumed && finished && frozen &&
        total == stopped_at) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (started=" << started << " held=" << held
                << " resumed=" << resumed << " finished=" << finished
                << " frozen=" << frozen << " total=" << total
                << " counted=" << stopped_at << ")" << std::endl;
      failures++;
    }
  }

  // Test 2: stopping while paused ends the copy
  std::cout << "Test 2: Stop while paused... ";
  {
    std::atomic<std::uint64_t> counted{0};
    halt::halter reader{zero_reader{}};
    counting_sink sink{&counted};
    auto remote = reader.remote();
    remote.pause();

    auto copied = std::async(std::launch::async,
                             [&] { return halt::copy(reader, sink); });

    std::this_thread::sleep_for(30ms);
    bool idle = counted.load() == 0;
    remote.stop();

    bool finished = copied.wait_for(2s) == std::future_status::ready;
    if (idle && finished && copied.get() == 0) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (idle=" << idle << " finished=" << finished << ")"
                << std::endl;
      failures++;
    }
  }

  // Test 3: a halted writer ends the copy as well
  std::cout << "Test 3: Stop on the writer side... ";
  {
    std::atomic<std::uint64_t> counted{0};
    zero_reader source;
    halt::halter writer{counting_sink{&counted}};
    auto remote = writer.remote();

    auto copied = std::async(std::launch::async,
                             [&] { return halt::copy(source, writer); });

    bool started =
        wait_until([&] { return counted.load() > 0; }, 2000ms);
    remote.stop();

    bool finished = copied.wait_for(2s) == std::future_status::ready;
    std::uint64_t total = finished ? copied.get() : 0;
    if (started && finished && total == counted.load()) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (started=" << started << " finished=" << finished
                << ")" << std::endl;
      failures++;
    }
  }

  // Test 4: partial writes are retried, bytes arrive intact
  std::cout << "Test 4: Partial writes... ";
  {
    std::vector<std::byte> payload(1000);
    for (std::size_t i = 0; i < payload.size(); ++i)
      payload[i] = static_cast<std::byte>(i * 7);

    halt::halter reader{slice_reader{payload}};
    trickle_writer writer;
    std::uint64_t total = halt::copy(reader, writer, {.buffer_size = 64});

    if (total == payload.size() && writer.data == payload) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (copied " << total << " bytes)" << std::endl;
      failures++;
    }
  }

  // Test 5: zero-sized buffer is rejected (edge case)
  std::cout << "Test 5: Zero buffer size... ";
  {
    std::atomic<std::uint64_t> counted{0};
    zero_reader source;
    counting_sink sink{&counted};
    try {
      halt::copy(source, sink, {.buffer_size = 0});
      std::cout << "FAIL (no exception)" << std::endl;
      failures++;
    } catch (const std::invalid_argument &) {
      std::cout << "PASS" << std::endl;
    }
  }

  // Test 6: a writer reporting more than it was handed
  std::cout << "Test 6: Over-reported write... ";
  {
    std::vector<std::byte> payload(100);
    for (std::size_t i = 0; i < payload.size(); ++i)
      payload[i] = static_cast<std::byte>(i);

    slice_reader reader{payload};
    boasting_writer writer;
    std::uint64_t total = halt::copy(reader, writer, {.buffer_size = 32});

    if (total == payload.size() && writer.data == payload) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (copied " << total << ", received "
                << writer.data.size() << ")" << std::endl;
      failures++;
    }
  }

  // Test 7: transfer buffers come from a private heap
  std::cout << "Test 7: Transfer arena... ";
  {
    halt::transfer_arena arena;
    halt::transfer_arena other;
    std::pmr::vector<std::byte> buffer(4096, &arena);
    int on_stack = 0;

    bool owned = arena.owns(buffer.data());
    bool foreign = !other.owns(buffer.data()) && !arena.owns(&on_stack);
    bool distinct = arena.is_equal(arena) && !arena.is_equal(other);

    void *aligned = arena.allocate(256, 64);
    bool is_aligned = reinterpret_cast<std::uintptr_t>(aligned) % 64 == 0;
    arena.deallocate(aligned, 256, 64);

    if (owned && foreign && distinct && is_aligned) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (owned=" << owned << " foreign=" << foreign
                << " distinct=" << distinct << " aligned=" << is_aligned << ")"
                << std::endl;
      failures++;
    }
  }

  // Summary
  std::cout << std::endl;
  if (failures == 0) {
    std::cout << "All tests passed!" << std::endl;
    return 0;
  } else {
    std::cout << failures << " test(s) failed!" << std::endl;
    return 1;
  }
}
