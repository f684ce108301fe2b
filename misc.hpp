#pragma once

#include <string>

#include <boost/asio/ip/address.hpp>

std::string
file_to_string(const std::string &p_path);

// throws std::runtime_error naming p_what when p_text is not an address
boost::asio::ip::address
address_from_string(const std::string &p_text, const std::string &p_what);
