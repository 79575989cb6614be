#pragma once

// content_accessor - where the rule_parser gets the text of the
// lists named by include: lines.
//
// archive_members serves them out of a zip_archive, looking for
// PREFIX+NAME, where PREFIX is the directory that holds the lists
// (domain-list-community-master/data/ in the v2fly zipball).

#include "geosite123/zip_archive.hpp"
#include <memory>
#include <string>
#include <vector>

namespace geosite123{

class content_accessor{
public:
    virtual ~content_accessor() = default;
    // Throws not_found_error if there's no such member, format_error
    // if it can't be decoded.
    virtual std::string fetch_member(const std::string& name) = 0;
};

class archive_members : public content_accessor{
public:
    archive_members(std::shared_ptr<const zip_archive> archive, std::string prefix) :
        archive_(std::move(archive)), prefix_(std::move(prefix)){}

    std::string fetch_member(const std::string& name) override;
    // The names of the regular members directly under the prefix,
    // in archive order.  Subdirectories are not descended into.
    std::vector<std::string> list() const;

    const std::string& prefix() const { return prefix_; }
private:
    std::shared_ptr<const zip_archive> archive_;
    std::string prefix_;
};

} // namespace geosite123
