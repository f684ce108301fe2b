#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

enum class dns_class : uint16_t {
    INTERNET = 1,
    CSNET    = 2,
    CHAOS    = 3,
    HESOID   = 4,
    ANY      = 255
};

// https://en.wikipedia.org/wiki/List_of_DNS_record_types
enum class dns_resource_record_type : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    SOA   = 6,
    PTR   = 12,
    HINFO = 13,
    MX    = 15,
    TXT   = 16,
    RP    = 17,
    AFSDB = 18,
    SIG   = 24,
    KEY   = 25,
    AAAA  = 28,
    LOC   = 29,
    SRV   = 33,
    OPT   = 41,
    ANY   = 255
};

enum class dns_opcode : uint8_t {
    QUERY  = 0,
    IQUERY = 1,
    STATUS = 2,
    NOTIFY = 4,
    UPDATE = 5
};

enum class dns_response_code : uint8_t {
    NOERROR  = 0,
    FORMERR  = 1,
    SERVFAIL = 2,
    NXDOMAIN = 3,
    NOTIMP   = 4,
    REFUSED  = 5
};

enum class dns_format_error_t {
    POINTER_LOOP,
    TRUNCATED_BUFFER,
    LABEL_TOO_LONG,
    NAME_TOO_LONG,
    COUNT_MISMATCH,
    BAD_RDATA
};

std::string dns_format_error_to_string(const dns_format_error_t p_kind);

class dns_format_error : public std::runtime_error {
public:
    dns_format_error(const dns_format_error_t p_kind, const std::string &p_what);

    dns_format_error_t kind() const noexcept { return m_kind; }

private:
    dns_format_error_t m_kind;
};

constexpr size_t g_dns_header_size     = 12;
constexpr size_t g_dns_max_label_size  = 63;
constexpr size_t g_dns_max_name_size   = 255;
constexpr size_t g_dns_udp_max_size    = 512;
constexpr size_t g_dns_tcp_max_size    = 65535;

// A domain name as a sequence of labels. Comparison ignores ASCII case, the
// empty sequence is the root.
class dns_name_t {
public:
    dns_name_t() = default;

    explicit dns_name_t(std::vector<std::string> p_labels);

    // accepts "example.com", "example.com." and "." (root)
    static dns_name_t from_string(const std::string &p_name);

    const std::vector<std::string> &labels() const noexcept { return m_labels; }

    bool is_root() const noexcept { return m_labels.empty(); }

    size_t label_count() const noexcept { return m_labels.size(); }

    // octets used on the wire without compression, including the root label
    size_t wire_size() const noexcept;

    dns_name_t parent() const;

    // true when this name equals p_zone or lies below it
    bool is_subdomain_of(const dns_name_t &p_zone) const noexcept;

    // lower cased, dotted, with a trailing dot
    std::string to_string() const;

    bool operator == (const dns_name_t &p_other) const noexcept;

    struct hasher {
        std::size_t operator() (const dns_name_t &p_name) const noexcept;
    };

private:
    std::vector<std::string> m_labels;
};

struct dns_header_t {
    uint16_t          m_id                  = 0;
    bool              m_response            = false;
    dns_opcode        m_opcode              = dns_opcode::QUERY;
    bool              m_authoritative       = false;
    bool              m_truncated           = false;
    bool              m_recursion_desired   = false;
    bool              m_recursion_available = false;
    // Z, AD and CD bits, carried through untouched
    uint8_t           m_reserved            = 0;
    dns_response_code m_response_code       = dns_response_code::NOERROR;

    bool operator == (const dns_header_t &p_other) const = default;
};

struct dns_question_t {
    dns_name_t               m_name;
    dns_resource_record_type m_type  = dns_resource_record_type::A;
    dns_class                m_class = dns_class::INTERNET;

    bool operator == (const dns_question_t &p_other) const = default;
};

struct a_data_t {
    boost::asio::ip::address_v4 m_address;

    bool operator == (const a_data_t &p_other) const = default;
};

struct aaaa_data_t {
    boost::asio::ip::address_v6 m_address;

    bool operator == (const aaaa_data_t &p_other) const = default;
};

struct ns_data_t {
    dns_name_t m_host;

    bool operator == (const ns_data_t &p_other) const = default;
};

struct cname_data_t {
    dns_name_t m_target;

    bool operator == (const cname_data_t &p_other) const = default;
};

struct mx_data_t {
    uint16_t   m_preference = 0;
    dns_name_t m_exchange;

    bool operator == (const mx_data_t &p_other) const = default;
};

struct txt_data_t {
    std::vector<std::string> m_strings;

    bool operator == (const txt_data_t &p_other) const = default;
};

struct soa_data_t {
    dns_name_t m_primary;
    dns_name_t m_mailbox;
    uint32_t   m_serial  = 0;
    uint32_t   m_refresh = 0;
    uint32_t   m_retry   = 0;
    uint32_t   m_expire  = 0;
    uint32_t   m_minimum = 0;

    bool operator == (const soa_data_t &p_other) const = default;
};

// payload of any type this resolver does not interpret, including OPT
struct opaque_data_t {
    std::vector<uint8_t> m_bytes;

    bool operator == (const opaque_data_t &p_other) const = default;
};

typedef std::variant<
    a_data_t,
    aaaa_data_t,
    ns_data_t,
    cname_data_t,
    mx_data_t,
    txt_data_t,
    soa_data_t,
    opaque_data_t
> dns_record_data_t;

struct dns_resource_record_t {
    dns_name_t               m_name;
    dns_resource_record_type m_type  = dns_resource_record_type::A;
    dns_class                m_class = dns_class::INTERNET;
    uint32_t                 m_ttl   = 0;
    dns_record_data_t        m_data;

    bool operator == (const dns_resource_record_t &p_other) const = default;

    std::string to_string() const;
};

typedef std::vector<dns_resource_record_t> dns_record_set_t;

struct dns_message_t {
    dns_header_t                m_header;
    std::vector<dns_question_t> m_questions;
    dns_record_set_t            m_answers;
    dns_record_set_t            m_authority;
    dns_record_set_t            m_additional;

    bool operator == (const dns_message_t &p_other) const = default;
};

dns_message_t
dns_decode_message(const std::span<const uint8_t> p_packet);

// Records are dropped from the end (additional, authority, answers) until the
// result fits p_max_size, setting the truncated flag. Questions and an OPT
// record are never dropped.
std::vector<uint8_t>
dns_encode_message(
    const dns_message_t &p_message,
    const size_t         p_max_size=g_dns_tcp_max_size
);

// transaction id of a possibly malformed packet, 0 when too short
uint16_t
dns_peek_id(const std::span<const uint8_t> p_packet) noexcept;

uint16_t
read_network_u16(const uint8_t *const p_buffer __attribute__((nonnull)));

uint32_t
read_network_u32(const uint8_t *const p_buffer __attribute__((nonnull)));

std::string dns_type_to_string(const dns_resource_record_type p_type);

std::string dns_class_to_string(const dns_class p_class);

std::string dns_response_code_to_string(const dns_response_code p_code);
