#pragma once
// option_parser - options declared once, set from the environment,
// from a flagfile and from the command line.
//
//   option_parser p;
//   unsigned short port;
//   std::string dest;
//   bool help = false;
//   p.add_option("port", "8080", "listen port", opt_setter(port));
//   p.add_option("log_destination", "%stderr", "where complaints go", opt_setter(dest));
//   p.add_option("help", "print this message", opt_true_setter(help));
//   p.setopts_from_env("GEO_");          // GEO_PORT, GEO_LOG_DESTINATION
//   auto leftover = p.setopts_from_argv(argc, argv);
//   if(help) std::cout << p.helptext();
//
// Each option's callback is called with the default when the option
// is added, so the variables are always initialized.  Option names
// match with '-' and '_' ignored and case folded, i.e., --log-destination,
// --logdestination and --log_destination are the same.
//
// Arguments that are not options (or that name unknown options) are
// returned in a vector.  "--" terminates option processing.
//
// --flagfile=FILE reads lines of the form "name = value" or "--name=value";
// blank lines and lines starting with # are ignored.
//
// Errors are reported by throwing option_error, possibly with nested
// exceptions from the callbacks.

#include <geocore/svto.hpp>
#include <geocore/throwutils.hpp>
#include <functional>
#include <string>
#include <map>
#include <vector>
#include <iostream>
#include <stdexcept>

namespace geocore{

struct option;
namespace detail{
template<typename T>
class _setter{
    T& v;
public:
    void operator()(const std::string& newv, const option&){ v = svto<T>(newv); }
    _setter(T& v_) : v(v_){}
};
} // namespace detail

template<typename T>
detail::_setter<T>
opt_setter(T& v){ return detail::_setter<T>(v); }

class opt_true_setter{
    bool& v;
public:
    void operator()(const option&){ v = true; }
    opt_true_setter(bool& v_) : v(v_){}
};

struct option_error : public std::runtime_error{
    explicit option_error(const std::string& what_arg) : std::runtime_error(what_arg){}
};

struct option{
    option(const std::string& name_, const std::string& dflt_, const std::string& desc_, std::function<void(const std::string&, const option&)> cb_):
        name(name_), desc(desc_), dflt(dflt_), value_callback(cb_)
    { set(dflt); }
    option(const std::string& name_, const std::string& desc_, std::function<void(const option&)> cb_):
        name(name_), desc(desc_), novalue_callback(cb_)
    { }

    bool value_required() const { return bool(value_callback); }
    const std::string& get_name() const { return name; }
    std::string get_value() const {
        if(!value_required())
            throw option_error("option::get_value:  option --" + name + " does not support values");
        return valstr;
    }
    const std::string& get_default() const { return dflt; }
    const std::string& get_desc() const { return desc; }
    void set(){
        if(value_required())
            throw option_error("option::set:  option --" + name + " requires a value");
        novalue_callback(*this);
    }
    void set(const std::string& newval){
        if(!value_required())
            throw option_error("option::set:  option --" + name + " does not support values");
        value_callback(newval, *this);
        valstr = newval;
    }
private:
    std::string name;
    std::string desc;
    std::string valstr;
    std::string dflt;
    std::function<void(const std::string&, const option&)> value_callback;
    std::function<void(const option&)> novalue_callback;
};

class option_parser {
public:
    typedef std::map<std::string, option> OptMap;

    option_parser();

    option& add_option(const std::string& name, const std::string& dflt, const std::string& desc,
                       std::function<void(const std::string&, const option&)> cb);
    option& add_option(const std::string& name, const std::string& desc,
                       std::function<void(const option&)> cb);

    void set(const std::string &name, const std::string &val);
    void set(const std::string &name);

    const OptMap& get_map() const { return optmap_; }

    std::vector<std::string> setopts_from_argv(int argc, char *argv[], int startindex = 1);
    std::vector<std::string> setopts_from_range(const std::vector<std::string>& args);
    // Looks for PREFIX + the upper-cased option name, e.g., GEO_ZIP_TTL.
    void setopts_from_env(const char *opt_env_prefix);
    void setopts_from_istream(std::istream& inpf);
    std::string helptext(size_t indent = 4) const;

private:
    OptMap optmap_;
    int flagfile_depth = 0;
    static std::string canonicalize(const std::string& word);
    option& at(const std::string& k);
};

} // namespace geocore
