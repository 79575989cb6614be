#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>

// periodic - call a function repeatedly in a separate thread.
//
// The function is called once immediately, and returns how long to
// wait before it is called again.  The destructor (or a call to
// stop()) wakes the thread, waits for any call in progress to finish
// and joins.  trigger() cuts the current wait short.
//
//   periodic sweeper([&](){
//       cache.sweep();
//       return std::chrono::seconds(600);
//   });
//
// An exception thrown by the function ends the loop, and is rethrown
// by stop().  Callers that want the loop to survive should catch
// inside the function.

namespace geocore{

class periodic{
public:
    using duration = std::chrono::system_clock::duration;

    explicit periodic(std::function<duration()> F){
        fut = std::async(std::launch::async,
                         [this, F]() {
                             std::unique_lock<std::mutex> lk(mtx);
                             while(!done){
                                 lk.unlock();
                                 auto how_long = F();
                                 lk.lock();
                                 if(done)
                                     break;
                                 cv.wait_until(lk, std::chrono::system_clock::now() + how_long,
                                               [this]{ return done || triggered; });
                                 triggered = false;
                             }
                         });
    }

    void trigger(){
        std::lock_guard<std::mutex> lk(mtx);
        triggered = true;
        cv.notify_all();
    }

    void stop(){
        {
            std::lock_guard<std::mutex> lk(mtx);
            done = true;
            cv.notify_all();
        }
        if(fut.valid())
            fut.get();
    }

    ~periodic(){
        {
            std::lock_guard<std::mutex> lk(mtx);
            done = true;
            cv.notify_all();
        }
        if(fut.valid())
            fut.wait();
    }
private:
    std::condition_variable cv;
    bool done = false;
    bool triggered = false;
    std::mutex mtx;
    std::future<void> fut;
};

} // namespace geocore
