#include "ioreactor/event-loop.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdio>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/descriptor.hpp"
#include "ioreactor/event-loop-config.hpp"
#include "ioreactor/fault.hpp"
#include "ioreactor/handler.hpp"
#include "ioreactor/poller.hpp"
#include "ioreactor/signal-handler.hpp"
#include "ioreactor/sys-test-support.hpp"
#include "ioreactor/timedef.hpp"

namespace {

// Scripted epoll_wait errors, empty queue means pass-through.
ioreactor::test::ActionQueue<int> gEpollWaitErrors;

}  // namespace

// NOLINTNEXTLINE(bugprone-reserved-identifier,readability-inconsistent-declaration-parameter-name)
extern "C" int epoll_wait(int epfd, struct epoll_event* events, int maxevents, int timeout) {
  using EpollWaitFn = int (*)(int, struct epoll_event*, int, int);
  static EpollWaitFn realEpollWait = ioreactor::test::ResolveNext<EpollWaitFn>("epoll_wait");
  if (const auto err = gEpollWaitErrors.pop(); err.has_value()) {
    errno = *err;
    return -1;
  }
  return realEpollWait(epfd, events, maxevents, timeout);
}

namespace ioreactor {

namespace {

using namespace std::chrono_literals;

struct SocketPair {
  SocketPair() {
    auto [first, second] = test::CreateSocketPair();
    local = Descriptor(std::move(first), Descriptor::Kind::Socket);
    peer = std::move(second);
  }

  Descriptor local;
  BaseFd peer;
};

std::string ReadAvailable(Descriptor& desc) {
  std::string out;
  std::array<std::byte, 256> buf;
  while (true) {
    const IoResult res = desc.read(buf);
    if (res.status != IoStatus::Ok) {
      break;
    }
    out.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
  }
  return out;
}

Handler OnReadable(std::function<void(Descriptor&)> cb) {
  Handler handler;
  handler.onReadable = std::move(cb);
  return handler;
}

}  // namespace

class EventLoopTest : public ::testing::TestWithParam<PollerKind> {
 protected:
  EventLoopConfig config() const { return EventLoopConfig{}.withPollerKind(GetParam()).withMaxPollInterval(100ms); }

  // Safety net against a test never stopping its loop.
  void armWatchdog(SteadyDuration delay = 5s) {
    loop.callAfter(delay, [this] {
      ADD_FAILURE() << "watchdog fired";
      loop.stop();
    });
  }

  EventLoop loop{config()};
};

INSTANTIATE_TEST_SUITE_P(AllPollers, EventLoopTest,
                         ::testing::Values(PollerKind::Epoll, PollerKind::Poll, PollerKind::Select),
                         [](const ::testing::TestParamInfo<PollerKind>& info) {
                           return std::string(PollerKindName(info.param));
                         });

TEST_P(EventLoopTest, UsesRequestedBackend) {
  EXPECT_EQ(loop.pollerKind(), GetParam());
  EXPECT_EQ(loop.pollerName(), PollerKindName(GetParam()));
  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(loop.nbRegistered(), 0U);
  EXPECT_EQ(loop.nbTimers(), 0U);
}

TEST_P(EventLoopTest, TimersFireInDeadlineOrderAndStopTheLoop) {
  std::vector<std::pair<int, SteadyDuration>> fired;
  const auto start = SteadyClock::now();
  loop.callAfter(50ms, [&] {
    fired.emplace_back(2, SteadyClock::now() - start);
    loop.stop();
  });
  loop.callAfter(10ms, [&] { fired.emplace_back(1, SteadyClock::now() - start); });
  armWatchdog();

  loop.run();

  ASSERT_EQ(fired.size(), 2U);
  EXPECT_EQ(fired[0].first, 1);
  EXPECT_GE(fired[0].second, 10ms);
  EXPECT_EQ(fired[1].first, 2);
  EXPECT_GE(fired[1].second, 50ms);
  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(loop.stats().timersFired, 2U);
}

TEST_P(EventLoopTest, StopFromHandlerIssuesNoFurtherPoll) {
  SocketPair pair;
  test::WriteAll(pair.peer.fd(), "x");
  uint64_t pollsAtStop = 0;
  loop.add(pair.local, OnReadable([&](Descriptor&) {
             pollsAtStop = loop.stats().polls;
             loop.stop();
           }));
  armWatchdog();

  loop.run();

  EXPECT_GT(pollsAtStop, 0U);
  EXPECT_EQ(loop.stats().polls, pollsAtStop);
  EXPECT_FALSE(loop.isRunning());
}

TEST_P(EventLoopTest, TwoSocketsDispatchOnlyReadyOne) {
  SocketPair first;
  SocketPair second;
  std::vector<std::string> received;
  loop.add(first.local, OnReadable([&](Descriptor& desc) { received.push_back("1:" + ReadAvailable(desc)); }));
  loop.add(second.local, OnReadable([&](Descriptor& desc) { received.push_back("2:" + ReadAvailable(desc)); }));
  EXPECT_EQ(loop.nbRegistered(), 2U);

  test::WriteAll(second.peer.fd(), "hello");
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(received, (std::vector<std::string>{"2:hello"}));

  test::WriteAll(first.peer.fd(), "world");
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(received, (std::vector<std::string>{"2:hello", "1:world"}));
  EXPECT_EQ(loop.stats().eventsDispatched, 2U);
}

TEST_P(EventLoopTest, LevelTriggeredUntilDrained) {
  SocketPair pair;
  int nbCalls = 0;
  loop.add(pair.local, OnReadable([&](Descriptor&) { ++nbCalls; }));
  test::WriteAll(pair.peer.fd(), "data");

  for (int cycle = 0; cycle < 3; ++cycle) {
    ASSERT_TRUE(loop.runOnce());
  }
  EXPECT_EQ(nbCalls, 3);

  EXPECT_EQ(ReadAvailable(pair.local), "data");
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbCalls, 3);
}

TEST_P(EventLoopTest, CloseFromOwnReadCallback) {
  SocketPair pair;
  const int fd = pair.local.fd();
  bool handleStillOpenInCallback = false;
  int nbCalls = 0;
  loop.add(pair.local, OnReadable([&](Descriptor& desc) {
             ++nbCalls;
             desc.close();
             EXPECT_EQ(desc.state(), Descriptor::State::Closing);
             // the handle value cannot be reused before the end of the dispatch step
             handleStillOpenInCallback = ::fcntl(fd, F_GETFD) != -1;
           }));
  test::WriteAll(pair.peer.fd(), "bye");

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbCalls, 1);
  EXPECT_TRUE(handleStillOpenInCallback);
  EXPECT_EQ(pair.local.state(), Descriptor::State::Closed);
  EXPECT_FALSE(pair.local.isOwned());
  EXPECT_FALSE(loop.isRegistered(fd));
  EXPECT_EQ(loop.nbRegistered(), 0U);

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbCalls, 1);
}

TEST_P(EventLoopTest, AddFromCallbackIsAppliedAfterDispatch) {
  SocketPair first;
  SocketPair second;
  int nbSecond = 0;
  test::WriteAll(first.peer.fd(), "a");
  test::WriteAll(second.peer.fd(), "b");
  loop.add(first.local, OnReadable([&](Descriptor& desc) {
             ReadAvailable(desc);
             if (!second.local.isOwned()) {
               loop.add(second.local, OnReadable([&](Descriptor& other) {
                          ++nbSecond;
                          ReadAvailable(other);
                        }));
               // counted right away, ownership taken
               EXPECT_TRUE(loop.isRegistered(second.local));
               EXPECT_TRUE(second.local.isOwned());
               EXPECT_EQ(loop.nbRegistered(), 2U);
               EXPECT_THROW(loop.add(second.local, Handler{}), std::system_error);
             }
           }));

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbSecond, 0);
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbSecond, 1);
}

TEST_P(EventLoopTest, RemoveFromCallbackStillDispatchesReportedReadiness) {
  SocketPair first;
  SocketPair second;
  int nbFirst = 0;
  int nbSecond = 0;
  loop.add(first.local, OnReadable([&](Descriptor&) {
             ++nbFirst;
             loop.remove(second.local);
           }));
  loop.add(second.local, OnReadable([&](Descriptor&) {
             ++nbSecond;
             loop.remove(first.local);
           }));
  test::WriteAll(first.peer.fd(), "1");
  test::WriteAll(second.peer.fd(), "2");

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbFirst, 1);
  EXPECT_EQ(nbSecond, 1);
  EXPECT_EQ(loop.nbRegistered(), 0U);
  EXPECT_FALSE(first.local.isOwned());
  EXPECT_FALSE(second.local.isOwned());
  EXPECT_TRUE(first.local.isOpen());

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbFirst, 1);
  EXPECT_EQ(nbSecond, 1);
}

TEST_P(EventLoopTest, RemoveThenAddBackFromCallback) {
  SocketPair pair;
  int nbOld = 0;
  int nbNew = 0;
  loop.add(pair.local, OnReadable([&](Descriptor& desc) {
             ++nbOld;
             EXPECT_TRUE(loop.remove(desc));
             EXPECT_FALSE(loop.remove(desc));
             loop.add(desc, OnReadable([&](Descriptor&) { ++nbNew; }));
           }));
  test::WriteAll(pair.peer.fd(), "x");

  ASSERT_TRUE(loop.runOnce());
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbOld, 1);
  EXPECT_EQ(nbNew, 1);
  EXPECT_TRUE(loop.isRegistered(pair.local));
}

TEST_P(EventLoopTest, RegistrationErrors) {
  SocketPair pair;
  loop.add(pair.local, Handler{});
  EXPECT_EQ(loop.nbRegistered(), 1U);

  try {
    loop.add(pair.local, Handler{});
    ADD_FAILURE() << "duplicate add should throw";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::errc::file_exists);
  }
  EXPECT_EQ(loop.nbRegistered(), 1U);

  EventLoop otherLoop(config());
  try {
    otherLoop.add(pair.local, Handler{});
    ADD_FAILURE() << "add to a second loop should throw";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::errc::file_exists);
  }
  EXPECT_EQ(otherLoop.nbRegistered(), 0U);

  Descriptor closed;
  try {
    loop.add(closed, Handler{});
    ADD_FAILURE() << "add of a closed descriptor should throw";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::errc::bad_file_descriptor);
  }

  SocketPair unregistered;
  EXPECT_FALSE(loop.remove(unregistered.local));
  EXPECT_FALSE(otherLoop.remove(pair.local));
  EXPECT_THROW(loop.modify(unregistered.local, Descriptor::Interest::Write), std::system_error);

  EXPECT_TRUE(loop.remove(pair.local));
  EXPECT_FALSE(loop.remove(pair.local));
  EXPECT_FALSE(pair.local.isOwned());
  EXPECT_EQ(loop.nbRegistered(), 0U);
}

// The backend registration set (isRegistered(fd), nbRegistered()) must match the loop registry
// (isRegistered(const Descriptor&)) after any sequence of registry changes, including from callbacks.
TEST_P(EventLoopTest, RegistryMatchesBackendThroughChurn) {
  // Frees low descriptor values for the wakeup fd of the loop, so that only 'big' exceeds the select capacity.
  std::optional<SocketPair> hole(std::in_place);
  std::array<SocketPair, 5> pairs;
  SocketPair big;
  hole.reset();

  EventLoopConfig churnConfig = config();
  if (GetParam() == PollerKind::Select) {
    churnConfig.withSelectCapacity(static_cast<uint32_t>(big.local.fd()));
  }
  EventLoop churnLoop(churnConfig);

  std::vector<Descriptor*> all;
  std::vector<NativeHandle> fds;
  for (SocketPair& pair : pairs) {
    all.push_back(&pair.local);
  }
  all.push_back(&big.local);
  for (Descriptor* desc : all) {
    fds.push_back(desc->fd());
  }

  auto checkConsistent = [&] {
    std::size_t nbRegistered = 0;
    for (std::size_t idx = 0; idx < all.size(); ++idx) {
      const Descriptor& desc = *all[idx];
      const bool inRegistry = churnLoop.isRegistered(desc);
      EXPECT_EQ(inRegistry, churnLoop.isRegistered(fds[idx])) << "fd # " << fds[idx];
      if (inRegistry) {
        EXPECT_TRUE(desc.isOpen());
        ++nbRegistered;
      }
    }
    EXPECT_EQ(churnLoop.nbRegistered(), nbRegistered);
  };

  int cycle = 0;
  bool bigRefused = false;
  std::function<Handler(std::size_t)> makeHandler;
  auto onReady = [&](std::size_t idx, Descriptor& desc) {
    switch (idx) {
      case 0:
        if (cycle == 1) {
          desc.close();
        }
        break;
      case 1:
        if (cycle == 1) {
          EXPECT_TRUE(churnLoop.remove(*all[2]));
          try {
            churnLoop.add(big.local, makeHandler(5));
          } catch (const std::system_error& ex) {
            EXPECT_EQ(ex.code(), std::errc::value_too_large);
            bigRefused = true;
          }
        } else if (cycle == 2 && !churnLoop.isRegistered(*all[2])) {
          churnLoop.add(*all[2], makeHandler(2));
        } else if (cycle == 3) {
          EXPECT_TRUE(churnLoop.remove(desc));
        }
        break;
      case 3:
        if (cycle == 1) {
          EXPECT_TRUE(churnLoop.remove(desc));
          churnLoop.add(desc, makeHandler(3));
        }
        break;
      case 4:
        if (cycle == 1) {
          churnLoop.modify(desc, Descriptor::Interest::Write);
        } else if (cycle == 2) {
          churnLoop.modify(desc, Descriptor::Interest::Read);
        }
        break;
      case 5:
        desc.close();
        break;
      default:
        break;
    }
    checkConsistent();
  };
  makeHandler = [&onReady](std::size_t idx) {
    Handler handler;
    handler.onReadable = [&onReady, idx](Descriptor& desc) { onReady(idx, desc); };
    handler.onWritable = [&onReady, idx](Descriptor& desc) { onReady(idx, desc); };
    return handler;
  };

  for (std::size_t idx = 0; idx < pairs.size(); ++idx) {
    churnLoop.add(pairs[idx].local, makeHandler(idx));
    test::WriteAll(pairs[idx].peer.fd(), "x");
  }
  test::WriteAll(big.peer.fd(), "x");
  checkConsistent();

  for (cycle = 1; cycle <= 4; ++cycle) {
    ASSERT_TRUE(churnLoop.runOnce());
    checkConsistent();
  }

  EXPECT_EQ(bigRefused, GetParam() == PollerKind::Select);
  EXPECT_EQ(pairs[0].local.state(), Descriptor::State::Closed);
  EXPECT_FALSE(churnLoop.isRegistered(pairs[1].local));
  EXPECT_TRUE(pairs[1].local.isOpen());
  EXPECT_TRUE(churnLoop.isRegistered(pairs[2].local));
  EXPECT_TRUE(churnLoop.isRegistered(pairs[3].local));
  EXPECT_TRUE(churnLoop.isRegistered(pairs[4].local));
  EXPECT_EQ(pairs[4].local.interest(), Descriptor::Interest::Read);
  if (bigRefused) {
    EXPECT_TRUE(big.local.isOpen());
    EXPECT_FALSE(big.local.isOwned());
  } else {
    EXPECT_EQ(big.local.state(), Descriptor::State::Closed);
  }
  EXPECT_EQ(churnLoop.nbRegistered(), 3U);
}

TEST_P(EventLoopTest, ModifyInterest) {
  SocketPair pair;
  int nbWritable = 0;
  int nbReadable = 0;
  Handler handler;
  handler.onWritable = [&](Descriptor&) { ++nbWritable; };
  handler.onReadable = [&](Descriptor&) { ++nbReadable; };
  pair.local.setInterest(Descriptor::Interest::Write);
  loop.add(pair.local, std::move(handler));

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbWritable, 1);
  EXPECT_EQ(nbReadable, 0);

  loop.modify(pair.local, Descriptor::Interest::Read);
  EXPECT_EQ(pair.local.interest(), Descriptor::Interest::Read);
  test::WriteAll(pair.peer.fd(), "r");
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbWritable, 1);
  EXPECT_EQ(nbReadable, 1);

  // through the Descriptor directly
  pair.local.setInterest(Descriptor::Interest::ReadWrite);
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbWritable, 2);
  EXPECT_EQ(nbReadable, 2);
}

TEST_P(EventLoopTest, WriteFaultReportsErrorAndCloses) {
  SocketPair pair;
  std::error_code reported;
  Handler handler;
  handler.onWritable = [](Descriptor& desc) { desc.write(std::string_view("lost")); };
  handler.onError = [&](Descriptor& desc, std::error_code ec) {
    reported = ec;
    EXPECT_TRUE(desc.isOpen());
  };
  pair.local.setInterest(Descriptor::Interest::Write);
  loop.add(pair.local, std::move(handler));
  pair.peer.close();

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(reported, std::errc::broken_pipe);
  EXPECT_EQ(pair.local.state(), Descriptor::State::Closed);
  EXPECT_EQ(loop.nbRegistered(), 0U);
}

// Reads at most 10 bytes per readiness report, closing on end of stream.
struct SlowReader {
  Handler handler() {
    Handler handler;
    handler.onReadable = [this](Descriptor& desc) {
      ++nbReadable;
      std::array<std::byte, 10> buf;
      const IoResult res = desc.read(buf);
      if (res.status == IoStatus::Ok) {
        received.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
      } else if (res.status == IoStatus::Eof) {
        desc.close();
      }
    };
    handler.onError = [this](Descriptor&, std::error_code) { ++nbErrors; };
    return handler;
  }

  std::string received;
  int nbReadable{};
  int nbErrors{};
};

TEST_P(EventLoopTest, PeerHangupLetsReaderDrainPendingInput) {
  SocketPair pair;
  SlowReader reader;
  loop.add(pair.local, reader.handler());
  const std::string payload(100, 'h');
  test::WriteAll(pair.peer.fd(), payload);
  pair.peer.close();

  for (int cycle = 0; cycle < 30 && pair.local.isOpen(); ++cycle) {
    ASSERT_TRUE(loop.runOnce());
  }
  EXPECT_EQ(reader.received, payload);
  EXPECT_EQ(reader.nbReadable, 11);
  EXPECT_EQ(reader.nbErrors, 0);
  EXPECT_EQ(pair.local.state(), Descriptor::State::Closed);
  EXPECT_EQ(loop.nbRegistered(), 0U);
}

TEST_P(EventLoopTest, ClosedPipeWriterLetsReaderDrainPendingInput) {
  auto [readEnd, writeEnd] = Descriptor::CreatePipe();
  SlowReader reader;
  loop.add(readEnd, reader.handler());
  const std::string payload(100, 'p');
  ASSERT_EQ(writeEnd.write(payload).status, IoStatus::Ok);
  writeEnd.close();

  for (int cycle = 0; cycle < 30 && readEnd.isOpen(); ++cycle) {
    ASSERT_TRUE(loop.runOnce());
  }
  EXPECT_EQ(reader.received, payload);
  EXPECT_EQ(reader.nbReadable, 11);
  EXPECT_EQ(reader.nbErrors, 0);
  EXPECT_EQ(readEnd.state(), Descriptor::State::Closed);
}

TEST_P(EventLoopTest, HandlerExceptionIsIsolated) {
  std::vector<Fault> faults;
  EventLoop faultLoop(config().withFaultHook([&](const Fault& fault) { faults.push_back(fault); }));
  SocketPair first;
  SocketPair second;
  int nbSecond = 0;
  faultLoop.add(first.local, OnReadable([](Descriptor&) { throw std::runtime_error("bad handler"); }));
  faultLoop.add(second.local, OnReadable([&](Descriptor& desc) {
                  ++nbSecond;
                  ReadAvailable(desc);
                }));
  test::WriteAll(first.peer.fd(), "1");
  test::WriteAll(second.peer.fd(), "2");

  ASSERT_TRUE(faultLoop.runOnce());
  EXPECT_EQ(nbSecond, 1);
  ASSERT_EQ(faults.size(), 1U);
  EXPECT_EQ(faults[0].fd, first.local.fd());
  EXPECT_EQ(faults[0].source, FaultSource::Readable);
  EXPECT_EQ(faults[0].message, "bad handler");
  EXPECT_EQ(faultLoop.stats().handlerFaults, 1U);
  // the descriptor stays registered
  EXPECT_TRUE(faultLoop.isRegistered(first.local));
}

TEST_P(EventLoopTest, TimerAndTaskExceptionsAreIsolated) {
  std::vector<Fault> faults;
  EventLoop faultLoop(config().withFaultHook([&](const Fault& fault) { faults.push_back(fault); }));
  bool nextTimerFired = false;
  faultLoop.callAfter(0ms, [] { throw std::runtime_error("bad timer"); });
  faultLoop.callAfter(0ms, [&] { nextTimerFired = true; });
  faultLoop.post([] { throw std::logic_error("bad task"); });

  ASSERT_TRUE(faultLoop.runOnce());
  EXPECT_TRUE(nextTimerFired);
  ASSERT_EQ(faults.size(), 2U);
  EXPECT_EQ(faults[0].source, FaultSource::Task);
  EXPECT_EQ(faults[0].message, "bad task");
  EXPECT_EQ(faults[1].source, FaultSource::Timer);
  EXPECT_EQ(faults[1].message, "bad timer");
  EXPECT_EQ(faultLoop.stats().timerFaults, 1U);
  EXPECT_EQ(faultLoop.stats().taskFaults, 1U);
  EXPECT_EQ(faultLoop.stats().handlerFaults, 0U);
  EXPECT_EQ(faultLoop.stats().postedTasksRun, 1U);
}

TEST_P(EventLoopTest, ThrowingFaultHookDoesNotEscapeTheCycle) {
  int nbHookCalls = 0;
  EventLoop faultLoop(config().withFaultHook([&](const Fault&) {
    ++nbHookCalls;
    throw 42;  // not a std::exception
  }));
  faultLoop.post([] { throw std::runtime_error("bad task"); });
  ASSERT_TRUE(faultLoop.runOnce());
  EXPECT_EQ(nbHookCalls, 1);
  EXPECT_EQ(faultLoop.stats().taskFaults, 1U);

  // still usable: a registration from a later callback is applied as usual
  SocketPair pair;
  bool added = false;
  faultLoop.post([&] {
    faultLoop.add(pair.local, Handler{});
    added = true;
  });
  ASSERT_TRUE(faultLoop.runOnce());
  EXPECT_TRUE(added);
  EXPECT_TRUE(faultLoop.isRegistered(pair.local));
  EXPECT_EQ(faultLoop.stats().cycles, 2U);
}

TEST_P(EventLoopTest, PostFromAnotherThreadWakesTheLoop) {
  loop.callAfter(5s, [this] { loop.stop(); });
  std::thread::id taskThread;
  std::thread poster([this, &taskThread] {
    std::this_thread::sleep_for(20ms);
    loop.post([this, &taskThread] {
      taskThread = std::this_thread::get_id();
      loop.stop();
    });
  });

  const auto start = SteadyClock::now();
  loop.run();
  poster.join();

  EXPECT_EQ(taskThread, std::this_thread::get_id());
  EXPECT_LT(SteadyClock::now() - start, 2s);
  EXPECT_EQ(loop.stats().postedTasksRun, 1U);
}

TEST_P(EventLoopTest, StopFromAnotherThread) {
  EventLoop uncapped(config().withMaxPollInterval(-1ms));
  std::thread stopper([&uncapped] {
    std::this_thread::sleep_for(20ms);
    uncapped.stop();
  });
  const auto start = SteadyClock::now();
  uncapped.run();
  stopper.join();
  EXPECT_LT(SteadyClock::now() - start, 2s);
}

TEST_P(EventLoopTest, RunWhenIdleReturns) {
  EventLoop idleLoop(config().withStopWhenIdle());
  int nbFired = 0;
  idleLoop.callAfter(5ms, [&] { ++nbFired; });

  idleLoop.run();
  EXPECT_EQ(nbFired, 1);
  EXPECT_EQ(idleLoop.nbTimers(), 0U);

  // nothing at all
  idleLoop.run();
  EXPECT_EQ(idleLoop.stats().cycles, idleLoop.stats().polls);
}

TEST_P(EventLoopTest, RunWhileRunningThrows) {
  bool thrown = false;
  loop.callAfter(0ms, [&] {
    try {
      loop.run();
    } catch (const std::logic_error&) {
      thrown = true;
    }
    loop.stop();
  });
  loop.run();
  EXPECT_TRUE(thrown);
}

TEST_P(EventLoopTest, RecurringTimer) {
  int nbFired = 0;
  TimerId id = kInvalidTimerId;
  id = loop.callEvery(2ms, [&] {
    if (++nbFired == 3) {
      EXPECT_TRUE(loop.cancel(id));
      loop.stop();
    }
  });
  EXPECT_EQ(loop.nbTimers(), 1U);
  armWatchdog();
  loop.run();
  EXPECT_EQ(nbFired, 3);
  EXPECT_FALSE(loop.cancel(id));
  EXPECT_THROW(loop.callEvery(0ms, [] {}), std::invalid_argument);
}

TEST_P(EventLoopTest, CallAtAndCancel) {
  bool cancelledFired = false;
  bool fired = false;
  const TimerId cancelled = loop.callAt(SteadyClock::now() + 1ms, [&] { cancelledFired = true; });
  loop.callAt(SteadyClock::now() + 5ms, [&] {
    fired = true;
    loop.stop();
  });
  EXPECT_TRUE(loop.cancel(cancelled));
  armWatchdog();
  loop.run();
  EXPECT_TRUE(fired);
  EXPECT_FALSE(cancelledFired);
}

TEST_P(EventLoopTest, DescriptorTimeout) {
  SocketPair pair;
  int nbTimeouts = 0;
  Handler handler;
  handler.onTimeout = [&](Descriptor& desc) {
    ++nbTimeouts;
    EXPECT_EQ(&desc, &pair.local);
    loop.stop();
  };
  loop.add(pair.local, std::move(handler));
  loop.armTimeout(pair.local, 10ms);
  // re-arming replaces the previous deadline
  loop.armTimeout(pair.local, 20ms);
  EXPECT_EQ(loop.nbTimers(), 1U);
  armWatchdog();

  const auto start = SteadyClock::now();
  loop.run();
  EXPECT_GE(SteadyClock::now() - start, 20ms);
  EXPECT_EQ(nbTimeouts, 1);
  EXPECT_FALSE(loop.disarmTimeout(pair.local));
}

TEST_P(EventLoopTest, DescriptorTimeoutDisarmedOrClearedOnRemove) {
  SocketPair first;
  SocketPair second;
  int nbTimeouts = 0;
  Handler handler;
  handler.onTimeout = [&](Descriptor&) { ++nbTimeouts; };
  loop.add(first.local, handler);
  loop.add(second.local, handler);
  loop.armTimeout(first.local, 1ms);
  loop.armTimeout(second.local, 1ms);
  EXPECT_TRUE(loop.disarmTimeout(first.local));
  EXPECT_TRUE(loop.remove(second.local));
  EXPECT_EQ(loop.nbTimers(), 0U);

  std::this_thread::sleep_for(5ms);
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbTimeouts, 0);

  SocketPair unregistered;
  EXPECT_THROW(loop.armTimeout(unregistered.local, 1ms), std::system_error);
}

TEST_P(EventLoopTest, RegisteredDescriptorCanBeMoved) {
  SocketPair pair;
  Descriptor* seen = nullptr;
  loop.add(pair.local, OnReadable([&](Descriptor& desc) {
             seen = &desc;
             ReadAvailable(desc);
           }));
  Descriptor moved(std::move(pair.local));
  EXPECT_FALSE(pair.local.isOwned());
  EXPECT_TRUE(moved.isOwned());
  EXPECT_TRUE(loop.isRegistered(moved));

  test::WriteAll(pair.peer.fd(), "m");
  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(seen, &moved);
}

TEST_P(EventLoopTest, DestroyedDescriptorIsUnregistered) {
  {
    SocketPair pair;
    loop.add(pair.local, Handler{});
    EXPECT_EQ(loop.nbRegistered(), 1U);
  }
  EXPECT_EQ(loop.nbRegistered(), 0U);
  ASSERT_TRUE(loop.runOnce());
}

TEST_P(EventLoopTest, DescriptorOutlivesItsLoop) {
  SocketPair pair;
  {
    EventLoop shortLoop(config());
    shortLoop.add(pair.local, Handler{});
    EXPECT_TRUE(pair.local.isOwned());
  }
  EXPECT_FALSE(pair.local.isOwned());
  EXPECT_TRUE(pair.local.isOpen());
  loop.add(pair.local, Handler{});
  EXPECT_TRUE(loop.isRegistered(pair.local));
}

TEST_P(EventLoopTest, SignalStopsTheLoop) {
  SignalHandler::Enable();
  loop.callAfter(1ms, [] { std::raise(SIGTERM); });
  armWatchdog();
  loop.run();
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  SignalHandler::ResetStopRequest();
  SignalHandler::Disable();
}

TEST(EventLoopConfigTest, InvalidConfigThrows) {
  EXPECT_THROW(EventLoop(EventLoopConfig{}.withInitialEventCapacity(0)), std::invalid_argument);
  EXPECT_THROW(EventLoop(EventLoopConfig{}.withMaxPollInterval(0ms)), std::invalid_argument);
}

TEST(EventLoopSelectTest, CapacityFaultIsReportedSynchronously) {
  EventLoop loop(EventLoopConfig{}.withPollerKind(PollerKind::Select).withSelectCapacity(3));
  SocketPair pair;
  ASSERT_GE(pair.local.fd(), 3);
  try {
    loop.add(pair.local, Handler{});
    ADD_FAILURE() << "registration above select capacity should throw";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::errc::value_too_large);
  }
  EXPECT_EQ(loop.nbRegistered(), 0U);
  EXPECT_FALSE(pair.local.isOwned());
}

TEST(EventLoopEpollTest, RegularFileIsRejected) {
  EventLoop loop(EventLoopConfig{}.withPollerKind(PollerKind::Epoll));
  char path[] = "/tmp/ioreactor-event-loop-XXXXXX";
  BaseFd tmpFd(::mkstemp(path));
  ASSERT_TRUE(tmpFd);
  Descriptor file = Descriptor::OpenFile(path, O_RDONLY);
  ::unlink(path);
  try {
    loop.add(file, Handler{});
    ADD_FAILURE() << "epoll cannot watch regular files";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::errc::operation_not_permitted);
  }
  EXPECT_EQ(loop.nbRegistered(), 0U);
}

// select has no hang-up notification: a hung up descriptor is only readable, hence the backend list.
class EventLoopHangupTest : public ::testing::TestWithParam<PollerKind> {
 protected:
  EventLoop loop{EventLoopConfig{}.withPollerKind(GetParam())};
};

INSTANTIATE_TEST_SUITE_P(HangupReportingPollers, EventLoopHangupTest,
                         ::testing::Values(PollerKind::Epoll, PollerKind::Poll),
                         [](const ::testing::TestParamInfo<PollerKind>& info) {
                           return std::string(PollerKindName(info.param));
                         });

TEST_P(EventLoopHangupTest, HangupWithoutReaderIsAnError) {
  SocketPair pair;
  std::error_code reported;
  Handler handler;
  handler.onError = [&](Descriptor&, std::error_code ec) { reported = ec; };
  loop.add(pair.local, std::move(handler));
  test::WriteAll(pair.peer.fd(), "unread");
  pair.peer.close();

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(reported, std::errc::broken_pipe);
  EXPECT_EQ(pair.local.state(), Descriptor::State::Closed);
}

TEST_P(EventLoopHangupTest, HangupWithNothingLeftToReadIsAnError) {
  auto [readEnd, writeEnd] = Descriptor::CreatePipe();
  int nbEof = 0;
  std::error_code reported;
  Handler handler;
  // observes the end of stream but keeps the descriptor open
  handler.onReadable = [&](Descriptor& desc) {
    std::array<std::byte, 16> buf;
    if (desc.read(buf).status == IoStatus::Eof) {
      ++nbEof;
    }
  };
  handler.onError = [&](Descriptor&, std::error_code ec) { reported = ec; };
  loop.add(readEnd, std::move(handler));
  writeEnd.close();

  ASSERT_TRUE(loop.runOnce());
  EXPECT_EQ(nbEof, 1);
  EXPECT_EQ(reported, std::errc::broken_pipe);
  EXPECT_EQ(readEnd.state(), Descriptor::State::Closed);
  EXPECT_EQ(loop.nbRegistered(), 0U);
}

TEST(EventLoopEpollTest, BackendFaultStopsRun) {
  EventLoop loop(EventLoopConfig{}.withPollerKind(PollerKind::Epoll));
  test::QueueResetGuard guard(gEpollWaitErrors);

  gEpollWaitErrors.push(EIO);
  EXPECT_FALSE(loop.runOnce());
  EXPECT_EQ(loop.pollerError(), std::errc::io_error);

  gEpollWaitErrors.push(EIO);
  try {
    loop.run();
    ADD_FAILURE() << "run should throw on backend failure";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code(), std::errc::io_error);
  }
  EXPECT_FALSE(loop.isRunning());

  // EINTR is not a failure
  gEpollWaitErrors.push(EINTR);
  EXPECT_TRUE(loop.runOnce());
}

}  // namespace ioreactor
