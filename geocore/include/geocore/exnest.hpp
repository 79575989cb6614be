// Walking a chain of nested exceptions.
//
// Annotate and rethrow with std::throw_with_nested:
//
//      catch(std::exception& e){
//         std::throw_with_nested(std::runtime_error("while refreshing"));
//      }
//
// and unpack at the final catch site with exnest (outermost first)
// or rexnest (innermost first):
//
//    catch(std::exception& e){
//       for(auto& a : exnest(e))
//          std::cout << a.what() << "\n";
//    }
//
// innermost(e) returns the originally thrown exception.  Don't call
// throw_with_nested outside of a catch handler: the iterators can't
// cope with a null nested_ptr.

#pragma once
#include <iterator>
#include <stdexcept>
#include <exception>
#include <vector>

namespace geocore{

template <class EXTYPE>
struct _exnest{
    EXTYPE& exref;
    _exnest(EXTYPE& e) : exref(e){}
    class iterator{
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = EXTYPE;
        using difference_type = std::ptrdiff_t;
        using pointer = EXTYPE*;
        using reference = EXTYPE&;
        pointer ep;
        explicit iterator(pointer _ep = nullptr) : ep(_ep){}
        iterator& operator++(){
            try{
                std::rethrow_if_nested(*ep);
                ep = nullptr;
            }catch(reference nested){
                ep = &nested;
            }
            return *this;
        }
        iterator operator++(int){
            iterator ret = *this;
            ++(*this);
            return ret;
        }
        bool operator==(iterator other) const { return ep == other.ep; }
        bool operator!=(iterator other) const { return !(*this == other); }
        reference operator*() const { return *ep; }
    };

    iterator begin(){ return iterator(&exref); }
    iterator end(){ return iterator(); }
};

inline _exnest<std::exception>
exnest(std::exception& e){
    return {e};
}

inline _exnest<const std::exception>
exnest(const std::exception& e){
    return {e};
}

template<class EXTYPE>
class _rexnest{
    using vrwex = std::vector<EXTYPE*>;
    vrwex ev;
    using vrwexri = typename vrwex::reverse_iterator;
public:
    _rexnest(EXTYPE& ex){
        for(auto& n : exnest(ex))
            ev.push_back(&n);
    }
    struct iterator : public vrwexri{
        iterator(const vrwexri& _base) : vrwexri(_base){}
        EXTYPE& operator*() const { return *vrwexri::operator*(); }
    };
    iterator begin(){ return ev.rbegin(); }
    iterator end(){ return ev.rend(); }
};

inline _rexnest<std::exception>
rexnest(std::exception& e){
    return {e};
}

inline _rexnest<const std::exception>
rexnest(const std::exception& e){
    return {e};
}

inline const std::exception&
innermost(const std::exception& e){
    try{
        std::rethrow_if_nested(e);
    }catch(const std::exception& nested){
        return innermost(nested);
    }
    return e;
}

} // namespace geocore
