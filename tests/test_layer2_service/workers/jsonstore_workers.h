#pragma once
/**
 * @file jsonstore_workers.h
 * @brief Worker scenarios for JsonStore ("jsonstore.<scenario>").
 */
#include <string>

namespace syncdesk::tests::worker::jsonstore
{

int read_write_update(const std::string &path);
int mutator_throw_leaves_file(const std::string &path);
int append_entries(const std::string &path, const std::string &tag, int count);
int lock_timeout_reported(const std::string &path);

} // namespace syncdesk::tests::worker::jsonstore
