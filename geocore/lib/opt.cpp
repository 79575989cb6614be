#include <geocore/opt.hpp>
#include <geocore/diag.hpp>
#include <geocore/strutils.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>

using namespace geocore;

static auto _opt = diag_name("opt");

option_parser::option_parser(){
    add_option("flagfile", "", "read flags from the named file",
               [this](const std::string& fname, const option&){
                   if(fname.empty()) // we get called with the default
                       return;
                   if(flagfile_depth++ > 10)
                       throw option_error("flagfile recursion depth exceeds limit (10) processing:" + fname);
                   std::ifstream ifs(fname);
                   if(!ifs)
                       throw option_error("could not open --flagfile=" + fname);
                   setopts_from_istream(ifs);
                   if(!ifs && !ifs.eof())
                       throw option_error("error reading from --flagfile=" + fname);
                   flagfile_depth--;
               });
}

std::string option_parser::canonicalize(const std::string& word){
    std::string ret;
    for(auto letter : word){
        if(letter == '-' || letter == '_')
            continue;
        ret.append(1, std::tolower(static_cast<unsigned char>(letter)));
    }
    return ret;
}

option& option_parser::at(const std::string& k) try {
    return optmap_.at(canonicalize(k));
}catch(std::out_of_range&){
    throw option_error("option_parser:  unknown option: " + k);
}

option& option_parser::add_option(const std::string& name, const std::string& dflt, const std::string& desc,
                                  std::function<void(const std::string&, const option&)> cb) try {
    auto ibpair = optmap_.emplace(std::piecewise_construct, std::forward_as_tuple(canonicalize(name)), std::forward_as_tuple(name, dflt, desc, cb));
    if(!ibpair.second)
        throw option_error("option_parser::add_option(" + name + ") already exists.");
    return ibpair.first->second;
}
catch(option_error&){throw;}
catch(std::exception&){std::throw_with_nested(option_error("option_error::" + strfunargs(__func__, name, dflt, desc)));}

option& option_parser::add_option(const std::string& name, const std::string& desc,
                                  std::function<void(const option&)> cb) try {
    auto ibpair = optmap_.emplace(std::piecewise_construct, std::forward_as_tuple(canonicalize(name)), std::forward_as_tuple(name, desc, cb));
    if(!ibpair.second)
        throw option_error("option_parser::add_option(" + name + ") already exists.");
    return ibpair.first->second;
}
catch(option_error&){throw;}
catch(std::exception&){std::throw_with_nested(option_error("option_error::" + strfunargs(__func__, name, desc)));}

void option_parser::set(const std::string &name, const std::string &val) try {
    DIAG(_opt, "--" << name << "=" << val);
    at(name).set(val);
}
catch(std::exception&){std::throw_with_nested(option_error("option_error::" + strfunargs(__func__, name, val)));}

void option_parser::set(const std::string &name) try {
    DIAG(_opt, "--" << name);
    at(name).set();
}
catch(std::exception&){std::throw_with_nested(option_error("option_error::" + strfunargs(__func__, name)));}

std::vector<std::string>
option_parser::setopts_from_argv(int argc, char *argv[], int startindex){
    std::vector<std::string> args;
    for(int i=startindex; i<argc; ++i)
        args.emplace_back(argv[i]);
    return setopts_from_range(args);
}

std::vector<std::string>
option_parser::setopts_from_range(const std::vector<std::string>& args){
    std::vector<std::string> leftover;
    for (auto i=args.begin() ; i!=args.end(); ++i){
        const std::string& cp = *i;
        if(!startswith(cp, "--")){
            leftover.push_back(cp);
            continue;
        }
        if(cp == "--"){
            for( ++i ; i!=args.end(); ++i)
                leftover.push_back(*i);
            break;
        }
        auto eqpos = cp.find("=", 2);
        auto optiter = optmap_.find(canonicalize(cp.substr(2, eqpos==std::string::npos ? eqpos : eqpos-2)));
        if(optiter == optmap_.end()){
            leftover.push_back(cp);
            continue;
        }
        auto& opt = optiter->second;
        try{
            if(eqpos != std::string::npos){
                opt.set(cp.substr(eqpos+1));
            }else if(opt.value_required()){
                if(++i == args.end())
                    throw option_error("Missing argument for option:" + cp);
                opt.set(*i);
            }else{
                opt.set();
            }
        }catch(option_error&){
            throw;
        }catch(std::exception&){
            std::throw_with_nested(option_error(std::string(__func__) + ": error while processing " + cp));
        }
    }
    return leftover;
}

void option_parser::setopts_from_env(const char *opt_env_prefix) try {
    for (const auto& o : optmap_) {
        std::string ename(opt_env_prefix);
        for (unsigned char c : o.second.get_name())
            ename += (c == '-') ? '_' : std::toupper(c);
        auto ecp = ::getenv(ename.c_str());
        if (ecp) set(o.first, ecp);
    }
}
catch(option_error&){ throw; }
catch(std::exception&){std::throw_with_nested(option_error("option_error::" + strfunargs(__func__, opt_env_prefix)));}

void option_parser::setopts_from_istream(std::istream& inpf){
    static const std::regex re("(--)?([-_[:alnum:]]+)\\s*(=?)\\s*(.*)");
    for (std::string line; getline(inpf, line);) {
        std::string s = strip(line);
        if(startswith(s, "#") || s.empty())
            continue;
        std::smatch mr;
        if(!std::regex_match(s, mr, re))
            throw option_error("setopts_from_istream: failed to parse line: " +line);
        auto name = mr.str(2);
        auto equals = mr.str(3);
        auto rhs = mr.str(4);
        if(!equals.empty() || !rhs.empty())
            set(name, rhs);
        else
            set(name);
    }
}

std::string option_parser::helptext(size_t indent) const {
    std::string ret;
    for (const auto& o : optmap_) {
        const option& opt = o.second;
        ret.append(indent, ' ');
        ret.append(opt.get_name());
        if(opt.value_required()){
            ret.append("=" + opt.get_value());
            ret.append(" (default=" + opt.get_default() + ")");
        }
        ret.append(" : ");
        ret.append(opt.get_desc());
        ret.append(1, '\n');
    }
    return ret;
}
