#pragma once

// make_autocloser - an owning pointer to a C-style handle that is
// released with the handle's own destructor function:
//
//    auto eb = make_autocloser(event_base_new(), ::event_base_free);
//    if(!eb) throw se("event_base_new failed");
//    event_base_loop(eb, 0);   // converts to the raw pointer
//
// The closer is never called with nullptr.  An exception thrown by
// the closer during destruction is reported on stderr and dropped.

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace geocore{

struct default_close_err_handler{
    void operator()(const std::exception& e) noexcept{
        std::cerr << "geocore::~autocloser_t threw an exception: " << e.what() << "\n";
    }
};

template<typename T, typename D, typename E = default_close_err_handler>
class autocloser_t : public std::unique_ptr<T, D>{
    using uP = std::unique_ptr<T, D>;
public:
    using pointer = typename uP::pointer;
    autocloser_t() : uP() {}
    autocloser_t(pointer v, D d) : uP(v, d) {}
    operator pointer() const { return this->get(); }
    ~autocloser_t(){
        try{
            close();
        }catch(std::exception& e){
            E()(e);
        }
    }
    autocloser_t(autocloser_t&&) = default;
    autocloser_t& operator=(autocloser_t&&) = default;

    void close(){
        pointer p = this->release();
        if(p != nullptr)
            this->get_deleter()(p);
    }
};

namespace detail{
template <typename T, typename Closer>
struct deleter{
    Closer f;
    deleter(Closer f_) : f(f_) {}
    void operator()(T* p){ f(p); }
};
} // namespace detail

template <typename T, typename Closer>
auto make_autocloser(T* ptr, Closer closer)
    -> autocloser_t<T, detail::deleter<T, Closer>>
{
    return {ptr, detail::deleter<T, Closer>(closer)};
}

} // namespace geocore
