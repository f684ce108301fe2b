#include <fstream>
#include <stdexcept>

#include "misc.hpp"

std::string
file_to_string(const std::string &p_path) {
    std::ifstream l_stream(p_path);

    if (l_stream.is_open() == false) {
        throw std::runtime_error("failed to open " + p_path);
    }

    return std::string(
        (std::istreambuf_iterator<char>(l_stream)),
        std::istreambuf_iterator<char>()
    );
}

boost::asio::ip::address
address_from_string(const std::string &p_text, const std::string &p_what)
{
    boost::system::error_code l_error;

    const boost::asio::ip::address l_address =
        boost::asio::ip::make_address(p_text, l_error);

    if (l_error) {
        throw std::runtime_error(
            "invalid " + p_what + " address '" + p_text + "': " +
                l_error.message()
        );
    }

    return l_address;
}
