#include <algorithm>
#include <cassert>
#include <cctype>
#include <unordered_map>

#include <boost/functional/hash.hpp>

#include "dns_codec.hpp"

std::string
dns_format_error_to_string(const dns_format_error_t p_kind)
{
    switch (p_kind) {
        case dns_format_error_t::POINTER_LOOP:
            return std::string("POINTER_LOOP"); break;
        case dns_format_error_t::TRUNCATED_BUFFER:
            return std::string("TRUNCATED_BUFFER"); break;
        case dns_format_error_t::LABEL_TOO_LONG:
            return std::string("LABEL_TOO_LONG"); break;
        case dns_format_error_t::NAME_TOO_LONG:
            return std::string("NAME_TOO_LONG"); break;
        case dns_format_error_t::COUNT_MISMATCH:
            return std::string("COUNT_MISMATCH"); break;
        case dns_format_error_t::BAD_RDATA:
            return std::string("BAD_RDATA"); break;
    }

    return std::string("unknown");
}

dns_format_error::dns_format_error(
    const dns_format_error_t p_kind,
    const std::string       &p_what
):
    std::runtime_error(dns_format_error_to_string(p_kind) + ": " + p_what),
    m_kind(p_kind)
{}

static std::string
to_lower(const std::string &p_input)
{
    std::string l_result(p_input);

    std::transform(l_result.begin(), l_result.end(), l_result.begin(),
        [](const unsigned char p_char) {
            return static_cast<char>(std::tolower(p_char));
        }
    );

    return l_result;
}

static bool
labels_equal(const std::string &p_left, const std::string &p_right) noexcept
{
    if (p_left.size() != p_right.size()) {
        return false;
    }

    for (size_t l_i = 0; l_i < p_left.size(); l_i++) {
        if (std::tolower(static_cast<unsigned char>(p_left[l_i])) !=
            std::tolower(static_cast<unsigned char>(p_right[l_i])))
        {
            return false;
        }
    }

    return true;
}

dns_name_t::dns_name_t(std::vector<std::string> p_labels):
    m_labels(std::move(p_labels))
{
    for (const auto &l_label : m_labels) {
        if (l_label.empty()) {
            throw dns_format_error(
                dns_format_error_t::BAD_RDATA, "empty label inside name"
            );
        }

        if (l_label.size() > g_dns_max_label_size) {
            throw dns_format_error(
                dns_format_error_t::LABEL_TOO_LONG,
                "label of " + std::to_string(l_label.size()) + " octets"
            );
        }
    }

    if (wire_size() > g_dns_max_name_size) {
        throw dns_format_error(
            dns_format_error_t::NAME_TOO_LONG,
            "name of " + std::to_string(wire_size()) + " octets"
        );
    }
}

dns_name_t
dns_name_t::from_string(const std::string &p_name)
{
    std::vector<std::string> l_labels;

    if (p_name.empty() || p_name == ".") {
        return dns_name_t();
    }

    size_t l_start = 0;

    while (l_start < p_name.size()) {
        const size_t l_dot = p_name.find('.', l_start);

        if (l_dot == std::string::npos) {
            l_labels.push_back(p_name.substr(l_start));

            break;
        }

        l_labels.push_back(p_name.substr(l_start, l_dot - l_start));

        l_start = l_dot + 1;
    }

    return dns_name_t(std::move(l_labels));
}

size_t
dns_name_t::wire_size() const noexcept
{
    size_t l_size = 1;

    for (const auto &l_label : m_labels) {
        l_size += l_label.size() + 1;
    }

    return l_size;
}

dns_name_t
dns_name_t::parent() const
{
    if (m_labels.empty()) {
        return dns_name_t();
    }

    return dns_name_t(
        std::vector<std::string>(m_labels.begin() + 1, m_labels.end())
    );
}

bool
dns_name_t::is_subdomain_of(const dns_name_t &p_zone) const noexcept
{
    if (p_zone.m_labels.size() > m_labels.size()) {
        return false;
    }

    const size_t l_offset = m_labels.size() - p_zone.m_labels.size();

    for (size_t l_i = 0; l_i < p_zone.m_labels.size(); l_i++) {
        if (!labels_equal(m_labels[l_offset + l_i], p_zone.m_labels[l_i])) {
            return false;
        }
    }

    return true;
}

std::string
dns_name_t::to_string() const
{
    if (m_labels.empty()) {
        return std::string(".");
    }

    std::string l_result;

    for (const auto &l_label : m_labels) {
        l_result += to_lower(l_label) + ".";
    }

    return l_result;
}

bool
dns_name_t::operator == (const dns_name_t &p_other) const noexcept
{
    if (m_labels.size() != p_other.m_labels.size()) {
        return false;
    }

    for (size_t l_i = 0; l_i < m_labels.size(); l_i++) {
        if (!labels_equal(m_labels[l_i], p_other.m_labels[l_i])) {
            return false;
        }
    }

    return true;
}

std::size_t
dns_name_t::hasher::operator() (const dns_name_t &p_name) const noexcept
{
    std::size_t l_seed = 0;

    for (const auto &l_label : p_name.m_labels) {
        for (const char l_char : l_label) {
            boost::hash_combine(
                l_seed,
                std::tolower(static_cast<unsigned char>(l_char))
            );
        }

        boost::hash_combine(l_seed, '.');
    }

    return l_seed;
}

uint16_t
read_network_u16(const uint8_t *const p_buffer)
{
    assert(p_buffer);

    return static_cast<uint16_t>((p_buffer[0] << 8) | p_buffer[1]);
}

uint32_t
read_network_u32(const uint8_t *const p_buffer)
{
    assert(p_buffer);

    return (static_cast<uint32_t>(p_buffer[0]) << 24)
        | (static_cast<uint32_t>(p_buffer[1]) << 16)
        | (static_cast<uint32_t>(p_buffer[2]) << 8)
        | static_cast<uint32_t>(p_buffer[3]);
}

uint16_t
dns_peek_id(const std::span<const uint8_t> p_packet) noexcept
{
    if (p_packet.size() < 2) {
        return 0;
    }

    return read_network_u16(p_packet.data());
}

namespace {

class packet_reader {
public:
    packet_reader(const std::span<const uint8_t> p_packet):
        m_packet(p_packet),
        m_position(0)
    {}

    size_t position() const noexcept { return m_position; }

    bool at_end() const noexcept { return m_position >= m_packet.size(); }

    void
    require(const size_t p_count) const
    {
        if (m_position + p_count > m_packet.size()) {
            throw dns_format_error(
                dns_format_error_t::TRUNCATED_BUFFER,
                "need " + std::to_string(p_count) + " octets at offset " +
                    std::to_string(m_position)
            );
        }
    }

    uint8_t
    read_u8()
    {
        require(1);

        return m_packet[m_position++];
    }

    uint16_t
    read_u16()
    {
        require(2);

        const uint16_t l_value = read_network_u16(m_packet.data() + m_position);

        m_position += 2;

        return l_value;
    }

    uint32_t
    read_u32()
    {
        require(4);

        const uint32_t l_value = read_network_u32(m_packet.data() + m_position);

        m_position += 4;

        return l_value;
    }

    std::vector<uint8_t>
    read_bytes(const size_t p_count)
    {
        require(p_count);

        const std::vector<uint8_t> l_result(
            m_packet.begin() + m_position,
            m_packet.begin() + m_position + p_count
        );

        m_position += p_count;

        return l_result;
    }

    // Follows compression pointers. Every pointer must target an offset
    // strictly below the previous jump origin so the walk always terminates.
    dns_name_t
    read_name()
    {
        std::vector<std::string> l_labels;

        size_t l_iter      = m_position;
        size_t l_limit     = m_position;
        size_t l_wire_size = 1;
        bool   l_jumped    = false;

        while (true) {
            if (l_iter >= m_packet.size()) {
                throw dns_format_error(
                    dns_format_error_t::TRUNCATED_BUFFER,
                    "name runs past end of packet"
                );
            }

            const uint8_t l_count = m_packet[l_iter];

            if ((l_count & 0xC0) == 0xC0) {
                if (l_iter + 2 > m_packet.size()) {
                    throw dns_format_error(
                        dns_format_error_t::TRUNCATED_BUFFER,
                        "compression pointer cut short"
                    );
                }

                const size_t l_target =
                    read_network_u16(m_packet.data() + l_iter) & 0x3FFF;

                if (l_target >= l_limit) {
                    throw dns_format_error(
                        dns_format_error_t::POINTER_LOOP,
                        "pointer at " + std::to_string(l_iter) +
                            " targets " + std::to_string(l_target)
                    );
                }

                if (!l_jumped) {
                    m_position = l_iter + 2;
                    l_jumped   = true;
                }

                l_limit = l_target;
                l_iter  = l_target;

                continue;
            } else if (l_count > g_dns_max_label_size) {
                throw dns_format_error(
                    dns_format_error_t::LABEL_TOO_LONG,
                    "label length byte " + std::to_string(l_count)
                );
            }

            l_iter++;

            if (l_count == 0) {
                break;
            }

            if (l_iter + l_count > m_packet.size()) {
                throw dns_format_error(
                    dns_format_error_t::TRUNCATED_BUFFER,
                    "label runs past end of packet"
                );
            }

            l_wire_size += l_count + 1;

            if (l_wire_size > g_dns_max_name_size) {
                throw dns_format_error(
                    dns_format_error_t::NAME_TOO_LONG,
                    "name exceeds 255 octets"
                );
            }

            l_labels.emplace_back(
                reinterpret_cast<const char *>(m_packet.data() + l_iter),
                l_count
            );

            l_iter += l_count;
        }

        if (!l_jumped) {
            m_position = l_iter;
        }

        return dns_name_t(std::move(l_labels));
    }

private:
    const std::span<const uint8_t> m_packet;
    size_t                         m_position;
};

class packet_writer {
public:
    packet_writer() {}

    size_t size() const noexcept { return m_buffer.size(); }

    void write_u8(const uint8_t p_value) { m_buffer.push_back(p_value); }

    void
    write_u16(const uint16_t p_value)
    {
        m_buffer.push_back(static_cast<uint8_t>((p_value >> 8) & 0xFF));
        m_buffer.push_back(static_cast<uint8_t>(p_value & 0xFF));
    }

    void
    write_u32(const uint32_t p_value)
    {
        write_u16(static_cast<uint16_t>(p_value >> 16));
        write_u16(static_cast<uint16_t>(p_value & 0xFFFF));
    }

    void
    write_bytes(const uint8_t *const p_data, const size_t p_size)
    {
        m_buffer.insert(m_buffer.end(), p_data, p_data + p_size);
    }

    void
    patch_u16(const size_t p_offset, const uint16_t p_value)
    {
        m_buffer[p_offset]     = static_cast<uint8_t>((p_value >> 8) & 0xFF);
        m_buffer[p_offset + 1] = static_cast<uint8_t>(p_value & 0xFF);
    }

    // Reuses the offset of any suffix already written. Only offsets that fit
    // the 14 bit pointer field are remembered.
    void
    write_name(const dns_name_t &p_name)
    {
        const std::vector<std::string> &l_labels = p_name.labels();

        for (size_t l_i = 0; l_i < l_labels.size(); l_i++) {
            const std::string l_key = suffix_key(l_labels, l_i);

            const auto l_iter = m_names.find(l_key);

            if (l_iter != m_names.end()) {
                write_u16(static_cast<uint16_t>(0xC000 | l_iter->second));

                return;
            }

            if (m_buffer.size() < 0x4000) {
                m_names[l_key] = static_cast<uint16_t>(m_buffer.size());
            }

            write_u8(static_cast<uint8_t>(l_labels[l_i].size()));
            write_bytes(
                reinterpret_cast<const uint8_t *>(l_labels[l_i].data()),
                l_labels[l_i].size()
            );
        }

        write_u8(0);
    }

    void truncate(const size_t p_size) { m_buffer.resize(p_size); }

    std::vector<uint8_t> release() { return std::move(m_buffer); }

private:
    static std::string
    suffix_key(const std::vector<std::string> &p_labels, const size_t p_start)
    {
        std::string l_key;

        for (size_t l_i = p_start; l_i < p_labels.size(); l_i++) {
            l_key.push_back(static_cast<char>(p_labels[l_i].size()));
            l_key += to_lower(p_labels[l_i]);
        }

        return l_key;
    }

    std::vector<uint8_t>                      m_buffer;
    std::unordered_map<std::string, uint16_t> m_names;
};

dns_header_t
decode_header(packet_reader &p_reader)
{
    dns_header_t l_header;

    l_header.m_id = p_reader.read_u16();

    const uint16_t l_flags = p_reader.read_u16();

    l_header.m_response            = (l_flags & (1 << 15)) != 0;
    l_header.m_opcode              =
        static_cast<dns_opcode>((l_flags >> 11) & 0x0F);
    l_header.m_authoritative       = (l_flags & (1 << 10)) != 0;
    l_header.m_truncated           = (l_flags & (1 << 9)) != 0;
    l_header.m_recursion_desired   = (l_flags & (1 << 8)) != 0;
    l_header.m_recursion_available = (l_flags & (1 << 7)) != 0;
    l_header.m_reserved            = (l_flags >> 4) & 0x07;
    l_header.m_response_code       =
        static_cast<dns_response_code>(l_flags & 0x0F);

    return l_header;
}

dns_question_t
decode_question(packet_reader &p_reader)
{
    dns_question_t l_question;

    l_question.m_name  = p_reader.read_name();
    l_question.m_type  =
        static_cast<dns_resource_record_type>(p_reader.read_u16());
    l_question.m_class = static_cast<dns_class>(p_reader.read_u16());

    return l_question;
}

dns_record_data_t
decode_record_data(
    packet_reader                 &p_reader,
    const dns_resource_record_type p_type,
    const uint16_t                 p_length
) {
    switch (p_type) {
        case dns_resource_record_type::A: {
            if (p_length != 4) {
                throw dns_format_error(
                    dns_format_error_t::BAD_RDATA, "A record expected 4 bytes"
                );
            }

            return a_data_t {
                .m_address = boost::asio::ip::address_v4(p_reader.read_u32())
            };
        }
        case dns_resource_record_type::AAAA: {
            if (p_length != 16) {
                throw dns_format_error(
                    dns_format_error_t::BAD_RDATA,
                    "AAAA record expected 16 bytes"
                );
            }

            const std::vector<uint8_t> l_bytes = p_reader.read_bytes(16);

            boost::asio::ip::address_v6::bytes_type l_address;

            std::copy(l_bytes.begin(), l_bytes.end(), l_address.begin());

            return aaaa_data_t {
                .m_address = boost::asio::ip::address_v6(l_address)
            };
        }
        case dns_resource_record_type::NS:
            return ns_data_t { .m_host = p_reader.read_name() };
        case dns_resource_record_type::CNAME:
            return cname_data_t { .m_target = p_reader.read_name() };
        case dns_resource_record_type::MX: {
            mx_data_t l_mx;

            l_mx.m_preference = p_reader.read_u16();
            l_mx.m_exchange   = p_reader.read_name();

            return l_mx;
        }
        case dns_resource_record_type::TXT: {
            txt_data_t   l_txt;
            const size_t l_end = p_reader.position() + p_length;

            while (p_reader.position() < l_end) {
                const uint8_t l_count = p_reader.read_u8();

                if (p_reader.position() + l_count > l_end) {
                    throw dns_format_error(
                        dns_format_error_t::BAD_RDATA,
                        "TXT string runs past record data"
                    );
                }

                const std::vector<uint8_t> l_bytes =
                    p_reader.read_bytes(l_count);

                l_txt.m_strings.emplace_back(l_bytes.begin(), l_bytes.end());
            }

            return l_txt;
        }
        case dns_resource_record_type::SOA: {
            soa_data_t l_soa;

            l_soa.m_primary = p_reader.read_name();
            l_soa.m_mailbox = p_reader.read_name();
            l_soa.m_serial  = p_reader.read_u32();
            l_soa.m_refresh = p_reader.read_u32();
            l_soa.m_retry   = p_reader.read_u32();
            l_soa.m_expire  = p_reader.read_u32();
            l_soa.m_minimum = p_reader.read_u32();

            return l_soa;
        }
        default:
            return opaque_data_t { .m_bytes = p_reader.read_bytes(p_length) };
    }
}

dns_resource_record_t
decode_record(packet_reader &p_reader)
{
    dns_resource_record_t l_record;

    l_record.m_name  = p_reader.read_name();
    l_record.m_type  =
        static_cast<dns_resource_record_type>(p_reader.read_u16());
    l_record.m_class = static_cast<dns_class>(p_reader.read_u16());

    const uint32_t l_ttl = p_reader.read_u32();

    // RFC 2181 section 8, values with the top bit set are treated as zero
    l_record.m_ttl = (l_ttl & 0x80000000) ? 0 : l_ttl;

    const uint16_t l_length = p_reader.read_u16();

    p_reader.require(l_length);

    const size_t l_start = p_reader.position();

    l_record.m_data = decode_record_data(p_reader, l_record.m_type, l_length);

    if (p_reader.position() != l_start + l_length) {
        throw dns_format_error(
            dns_format_error_t::BAD_RDATA,
            dns_type_to_string(l_record.m_type) + " data length " +
                std::to_string(l_length) + " does not match contents"
        );
    }

    return l_record;
}

void
decode_records(
    packet_reader    &p_reader,
    const uint16_t    p_count,
    dns_record_set_t &p_result
) {
    for (uint16_t l_i = 0; l_i < p_count; l_i++) {
        if (p_reader.at_end()) {
            throw dns_format_error(
                dns_format_error_t::COUNT_MISMATCH,
                "header declares more records than the packet holds"
            );
        }

        p_result.push_back(decode_record(p_reader));
    }
}

void
encode_header(
    packet_writer      &p_writer,
    const dns_header_t &p_header
) {
    p_writer.write_u16(p_header.m_id);

    p_writer.write_u16(
        (static_cast<uint16_t>(p_header.m_response) << 15)
            | ((static_cast<uint16_t>(p_header.m_opcode) & 0x0F) << 11)
            | (static_cast<uint16_t>(p_header.m_authoritative) << 10)
            | (static_cast<uint16_t>(p_header.m_truncated) << 9)
            | (static_cast<uint16_t>(p_header.m_recursion_desired) << 8)
            | (static_cast<uint16_t>(p_header.m_recursion_available) << 7)
            | ((static_cast<uint16_t>(p_header.m_reserved) & 0x07) << 4)
            | (static_cast<uint16_t>(p_header.m_response_code) & 0x0F)
    );

    // counts are patched once the sections are written
    p_writer.write_u16(0);
    p_writer.write_u16(0);
    p_writer.write_u16(0);
    p_writer.write_u16(0);
}

void
encode_record_data(
    packet_writer           &p_writer,
    const dns_record_data_t &p_data
) {
    if (const auto *l_a = std::get_if<a_data_t>(&p_data)) {
        p_writer.write_u32(l_a->m_address.to_uint());
    } else if (const auto *l_aaaa = std::get_if<aaaa_data_t>(&p_data)) {
        const auto l_bytes = l_aaaa->m_address.to_bytes();

        p_writer.write_bytes(l_bytes.data(), l_bytes.size());
    } else if (const auto *l_ns = std::get_if<ns_data_t>(&p_data)) {
        p_writer.write_name(l_ns->m_host);
    } else if (const auto *l_cname = std::get_if<cname_data_t>(&p_data)) {
        p_writer.write_name(l_cname->m_target);
    } else if (const auto *l_mx = std::get_if<mx_data_t>(&p_data)) {
        p_writer.write_u16(l_mx->m_preference);
        p_writer.write_name(l_mx->m_exchange);
    } else if (const auto *l_txt = std::get_if<txt_data_t>(&p_data)) {
        for (const auto &l_string : l_txt->m_strings) {
            if (l_string.size() > 255) {
                throw dns_format_error(
                    dns_format_error_t::BAD_RDATA,
                    "TXT string longer than 255 octets"
                );
            }

            p_writer.write_u8(static_cast<uint8_t>(l_string.size()));
            p_writer.write_bytes(
                reinterpret_cast<const uint8_t *>(l_string.data()),
                l_string.size()
            );
        }
    } else if (const auto *l_soa = std::get_if<soa_data_t>(&p_data)) {
        p_writer.write_name(l_soa->m_primary);
        p_writer.write_name(l_soa->m_mailbox);
        p_writer.write_u32(l_soa->m_serial);
        p_writer.write_u32(l_soa->m_refresh);
        p_writer.write_u32(l_soa->m_retry);
        p_writer.write_u32(l_soa->m_expire);
        p_writer.write_u32(l_soa->m_minimum);
    } else if (const auto *l_opaque = std::get_if<opaque_data_t>(&p_data)) {
        p_writer.write_bytes(l_opaque->m_bytes.data(), l_opaque->m_bytes.size());
    }
}

void
encode_record(
    packet_writer               &p_writer,
    const dns_resource_record_t &p_record
) {
    p_writer.write_name(p_record.m_name);
    p_writer.write_u16(static_cast<uint16_t>(p_record.m_type));
    p_writer.write_u16(static_cast<uint16_t>(p_record.m_class));
    p_writer.write_u32(p_record.m_ttl);

    const size_t l_length_offset = p_writer.size();

    p_writer.write_u16(0);

    encode_record_data(p_writer, p_record.m_data);

    const size_t l_length = p_writer.size() - l_length_offset - 2;

    if (l_length > 0xFFFF) {
        throw dns_format_error(
            dns_format_error_t::BAD_RDATA, "record data exceeds 65535 octets"
        );
    }

    p_writer.patch_u16(l_length_offset, static_cast<uint16_t>(l_length));
}

} // namespace

dns_message_t
dns_decode_message(const std::span<const uint8_t> p_packet)
{
    if (p_packet.size() < g_dns_header_size) {
        throw dns_format_error(
            dns_format_error_t::TRUNCATED_BUFFER,
            "packet of " + std::to_string(p_packet.size()) +
                " octets is shorter than a header"
        );
    }

    packet_reader l_reader(p_packet);
    dns_message_t l_message;

    l_message.m_header = decode_header(l_reader);

    const uint16_t l_question_count   = l_reader.read_u16();
    const uint16_t l_answer_count     = l_reader.read_u16();
    const uint16_t l_authority_count  = l_reader.read_u16();
    const uint16_t l_additional_count = l_reader.read_u16();

    for (uint16_t l_i = 0; l_i < l_question_count; l_i++) {
        if (l_reader.at_end()) {
            throw dns_format_error(
                dns_format_error_t::COUNT_MISMATCH,
                "header declares " + std::to_string(l_question_count) +
                    " questions, packet holds " + std::to_string(l_i)
            );
        }

        l_message.m_questions.push_back(decode_question(l_reader));
    }

    decode_records(l_reader, l_answer_count, l_message.m_answers);
    decode_records(l_reader, l_authority_count, l_message.m_authority);
    decode_records(l_reader, l_additional_count, l_message.m_additional);

    return l_message;
}

std::vector<uint8_t>
dns_encode_message(
    const dns_message_t &p_message,
    const size_t         p_max_size
) {
    packet_writer l_writer;

    encode_header(l_writer, p_message.m_header);

    for (const auto &l_question : p_message.m_questions) {
        l_writer.write_name(l_question.m_name);
        l_writer.write_u16(static_cast<uint16_t>(l_question.m_type));
        l_writer.write_u16(static_cast<uint16_t>(l_question.m_class));
    }

    const size_t l_questions_end = l_writer.size();

    // end offset of every record in wire order
    std::vector<size_t> l_record_ends;

    for (const auto *l_section : {
        &p_message.m_answers,
        &p_message.m_authority,
        &p_message.m_additional
    }) {
        for (const auto &l_record : *l_section) {
            encode_record(l_writer, l_record);

            l_record_ends.push_back(l_writer.size());
        }
    }

    size_t l_kept      = l_record_ends.size();
    bool   l_truncated = p_message.m_header.m_truncated;

    const auto l_opt = std::find_if(
        p_message.m_additional.begin(),
        p_message.m_additional.end(),
        [](const dns_resource_record_t &p_record) {
            return p_record.m_type == dns_resource_record_type::OPT;
        }
    );

    if (l_writer.size() > p_max_size && l_opt != p_message.m_additional.end()) {
        packet_writer l_opt_writer;

        encode_record(l_opt_writer, *l_opt);

        // the OPT record stays, the rest is cut to fit around it
        if (l_opt_writer.size() < p_max_size) {
            dns_message_t l_rest = p_message;

            l_rest.m_additional.erase(
                l_rest.m_additional.begin() +
                    (l_opt - p_message.m_additional.begin())
            );

            std::vector<uint8_t> l_result =
                dns_encode_message(l_rest, p_max_size - l_opt_writer.size());

            const std::vector<uint8_t> l_opt_bytes = l_opt_writer.release();

            l_result.insert(l_result.end(), l_opt_bytes.begin(), l_opt_bytes.end());

            const uint16_t l_additional = static_cast<uint16_t>(
                ((l_result[10] << 8) | l_result[11]) + 1
            );

            l_result[10] = static_cast<uint8_t>(l_additional >> 8);
            l_result[11] = static_cast<uint8_t>(l_additional & 0xFF);
            l_result[2] |= 0x02;

            return l_result;
        }
    }

    if (l_writer.size() > p_max_size) {
        // compression pointers only ever refer backwards, so any record
        // boundary is a valid place to cut
        l_kept = 0;

        while (l_kept < l_record_ends.size() &&
            l_record_ends[l_kept] <= p_max_size)
        {
            l_kept++;
        }

        l_writer.truncate(l_kept ? l_record_ends[l_kept - 1] : l_questions_end);

        l_truncated = true;
    }

    const size_t l_answers   =
        std::min(l_kept, p_message.m_answers.size());
    const size_t l_authority =
        std::min(l_kept - l_answers, p_message.m_authority.size());
    const size_t l_additional = l_kept - l_answers - l_authority;

    l_writer.patch_u16(4, static_cast<uint16_t>(p_message.m_questions.size()));
    l_writer.patch_u16(6, static_cast<uint16_t>(l_answers));
    l_writer.patch_u16(8, static_cast<uint16_t>(l_authority));
    l_writer.patch_u16(10, static_cast<uint16_t>(l_additional));

    std::vector<uint8_t> l_result = l_writer.release();

    if (l_truncated) {
        l_result[2] |= 0x02;
    }

    return l_result;
}

std::string
dns_type_to_string(const dns_resource_record_type p_type)
{
    switch (p_type) {
        case dns_resource_record_type::A:     return std::string("A");
        case dns_resource_record_type::NS:    return std::string("NS");
        case dns_resource_record_type::CNAME: return std::string("CNAME");
        case dns_resource_record_type::SOA:   return std::string("SOA");
        case dns_resource_record_type::PTR:   return std::string("PTR");
        case dns_resource_record_type::HINFO: return std::string("HINFO");
        case dns_resource_record_type::MX:    return std::string("MX");
        case dns_resource_record_type::TXT:   return std::string("TXT");
        case dns_resource_record_type::RP:    return std::string("RP");
        case dns_resource_record_type::AFSDB: return std::string("AFSDB");
        case dns_resource_record_type::SIG:   return std::string("SIG");
        case dns_resource_record_type::KEY:   return std::string("KEY");
        case dns_resource_record_type::AAAA:  return std::string("AAAA");
        case dns_resource_record_type::LOC:   return std::string("LOC");
        case dns_resource_record_type::SRV:   return std::string("SRV");
        case dns_resource_record_type::OPT:   return std::string("OPT");
        case dns_resource_record_type::ANY:   return std::string("ANY");
    }

    return "TYPE" + std::to_string(static_cast<uint16_t>(p_type));
}

std::string
dns_class_to_string(const dns_class p_class)
{
    switch (p_class) {
        case dns_class::INTERNET: return std::string("IN");
        case dns_class::CSNET:    return std::string("CS");
        case dns_class::CHAOS:    return std::string("CH");
        case dns_class::HESOID:   return std::string("HS");
        case dns_class::ANY:      return std::string("ANY");
    }

    return "CLASS" + std::to_string(static_cast<uint16_t>(p_class));
}

std::string
dns_response_code_to_string(const dns_response_code p_code)
{
    switch (p_code) {
        case dns_response_code::NOERROR:  return std::string("NOERROR");
        case dns_response_code::FORMERR:  return std::string("FORMERR");
        case dns_response_code::SERVFAIL: return std::string("SERVFAIL");
        case dns_response_code::NXDOMAIN: return std::string("NXDOMAIN");
        case dns_response_code::NOTIMP:   return std::string("NOTIMP");
        case dns_response_code::REFUSED:  return std::string("REFUSED");
    }

    return "RCODE" + std::to_string(static_cast<uint8_t>(p_code));
}

std::string
dns_resource_record_t::to_string() const
{
    std::string l_data;

    if (const auto *l_a = std::get_if<a_data_t>(&m_data)) {
        l_data = l_a->m_address.to_string();
    } else if (const auto *l_aaaa = std::get_if<aaaa_data_t>(&m_data)) {
        l_data = l_aaaa->m_address.to_string();
    } else if (const auto *l_ns = std::get_if<ns_data_t>(&m_data)) {
        l_data = l_ns->m_host.to_string();
    } else if (const auto *l_cname = std::get_if<cname_data_t>(&m_data)) {
        l_data = l_cname->m_target.to_string();
    } else if (const auto *l_mx = std::get_if<mx_data_t>(&m_data)) {
        l_data = std::to_string(l_mx->m_preference) + " " +
            l_mx->m_exchange.to_string();
    } else if (const auto *l_txt = std::get_if<txt_data_t>(&m_data)) {
        for (const auto &l_string : l_txt->m_strings) {
            l_data += (l_data.empty() ? "\"" : " \"") + l_string + "\"";
        }
    } else if (const auto *l_soa = std::get_if<soa_data_t>(&m_data)) {
        l_data = l_soa->m_primary.to_string() + " " +
            l_soa->m_mailbox.to_string() + " " +
            std::to_string(l_soa->m_serial) + " " +
            std::to_string(l_soa->m_refresh) + " " +
            std::to_string(l_soa->m_retry) + " " +
            std::to_string(l_soa->m_expire) + " " +
            std::to_string(l_soa->m_minimum);
    } else if (const auto *l_opaque = std::get_if<opaque_data_t>(&m_data)) {
        l_data = "\\# " + std::to_string(l_opaque->m_bytes.size());
    }

    return m_name.to_string() + " " + std::to_string(m_ttl) + " " +
        dns_class_to_string(m_class) + " " + dns_type_to_string(m_type) + " " +
        l_data;
}
