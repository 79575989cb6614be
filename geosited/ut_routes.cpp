#include "geosited_handler.hpp"
#include <geocore/http_error_category.hpp>
#include <geocore/ut.hpp>
#include <system_error>

using namespace geocore;
using geosite123::dialect;

namespace{
// The http status parse_route throws, or 0 if it doesn't.
int throws_status(str_view path){
    try{
        parse_route(path);
    }catch(std::system_error& e){
        return e.code().value();
    }
    return 0;
}

int kind(str_view path){
    return int(parse_route(path).kind);
}
} // namespace <anon>

int main(int, char **){
    EQUAL(kind("/"), int(route_kind::root));

    for(auto p : {"/geosite", "/geosite/", "/geosite/surge", "/geosite/surge/",
                  "/geosite/mihomo", "/geosite/mihomo/", "/geosite/egern", "/geosite/egern/"})
        EQUAL(kind(p), int(route_kind::index));

    auto r = parse_route("/geosite/Google@CN");
    EQUAL(int(r.kind), int(route_kind::ruleset));
    EQSTR(r.name, "google");
    EQSTR(r.filter, "cn");
    CHECK(r.dialect == dialect::surge);

    r = parse_route("/geosite/surge/apple");
    EQSTR(r.name, "apple");
    EQSTR(r.filter, "");
    CHECK(r.dialect == dialect::surge);

    r = parse_route("/geosite/mihomo/category-ads-all@ads");
    CHECK(r.dialect == dialect::mihomo);
    EQSTR(r.name, "category-ads-all");
    EQSTR(r.filter, "ads");

    r = parse_route("/geosite/egern/netflix");
    CHECK(r.dialect == dialect::egern);
    EQSTR(r.name, "netflix");

    // Only the first '@' splits.
    r = parse_route("/geosite/a@b@c");
    EQSTR(r.name, "a");
    EQSTR(r.filter, "b@c");

    // A name that merely starts with a dialect isn't one.
    r = parse_route("/geosite/surgeon");
    EQUAL(int(r.kind), int(route_kind::ruleset));
    EQSTR(r.name, "surgeon");
    CHECK(r.dialect == dialect::surge);

    // Surrounding whitespace (after uri-decoding) is ignored.
    r = parse_route("/geosite/ google ");
    EQSTR(r.name, "google");

    EQUAL(throws_status("/geosite/@cn"), 400);
    EQUAL(throws_status("/geosite/mihomo/@cn"), 400);
    EQUAL(throws_status("/geosite/   "), 400);

    r = parse_route("/misc/Telegram/IPs");
    EQUAL(int(r.kind), int(route_kind::misc));
    EQSTR(r.category, "telegram");
    EQSTR(r.name, "ips");
    EQUAL(throws_status("/misc/a"), 400);
    EQUAL(throws_status("/misc/a/b/c"), 400);
    EQUAL(throws_status("/misc/a/"), 400);
    EQUAL(throws_status("/misc/../x"), 400);

    EQUAL(kind("/geositex"), int(route_kind::not_found));
    EQUAL(kind("/favicon.ico"), int(route_kind::not_found));
    EQUAL(kind("/misc"), int(route_kind::not_found));
    EQUAL(throws_status("/nowhere"), 0);

    return utstatus();
}
