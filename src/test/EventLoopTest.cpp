#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "infrastructure/EventLoop.hpp"

using scribeline::infrastructure::EventLoop;
using std::chrono::milliseconds;

namespace {

void TestDueOrderAndFifo() {
    EventLoop loop;
    std::vector<std::string> order;
    loop.schedule(milliseconds(20), [&] { order.push_back("late"); });
    loop.schedule(milliseconds(0), [&] { order.push_back("first"); });
    loop.schedule(milliseconds(0), [&] {
        order.push_back("second");
        loop.schedule(milliseconds(0), [&] { order.push_back("nested"); });
    });
    const auto started = loop.now();
    loop.run();
    assert((order == std::vector<std::string>{"first", "second", "nested", "late"}));
    assert(loop.now() - started >= milliseconds(20));
    assert(loop.empty());
    std::cout << "[PASS] Tasks run in due order, FIFO among equals." << std::endl;
}

void TestCancelAndStop() {
    EventLoop loop;
    int ran = 0;
    const auto doomed = loop.schedule(milliseconds(0), [&] { ran += 100; });
    loop.schedule(milliseconds(0), [&] {
        ++ran;
        loop.stop();
    });
    loop.schedule(milliseconds(0), [&] { ++ran; });
    assert(loop.cancel(doomed));
    assert(!loop.cancel(doomed));
    loop.run();
    assert(ran == 1);
    assert(loop.pending() == 1);
    loop.run();
    assert(ran == 2);
    std::cout << "[PASS] Cancelled tasks never run and stop() pauses the loop." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EventLoop Test..." << std::endl;
    TestDueOrderAndFifo();
    TestCancelAndStop();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
