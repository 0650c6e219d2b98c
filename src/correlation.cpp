#include "agentval/correlation.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentval
{
namespace
{

std::string to_hex(const uint8_t* bytes, size_t count)
{
    std::ostringstream oss;
    for (size_t i = 0; i < count; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return oss.str();
}

} // namespace

std::string generate_correlation_id()
{
    std::array<uint8_t, 16> bytes{};
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<uint32_t> dist(0, 255);
    for (auto& b : bytes)
        b = static_cast<uint8_t>(dist(gen));

    // Version 4, variant 10xx.
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    auto hex = to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool is_uuid(const std::string& value)
{
    if (value.size() != 36)
        return false;
    for (size_t i = 0; i < value.size(); ++i)
    {
        bool dash = i == 8 || i == 13 || i == 18 || i == 23;
        if (dash ? value[i] != '-' : std::isxdigit(static_cast<unsigned char>(value[i])) == 0)
            return false;
    }
    return true;
}

CorrelationContext::CorrelationContext(std::string id, Json context)
    : id_(std::move(id)), context_(context.is_object() ? std::move(context) : Json::object())
{
}

CorrelationContext CorrelationContext::create(const Json& context,
                                              const std::optional<std::string>& id)
{
    if (id && !id->empty())
        return CorrelationContext(*id, context);
    if (context.is_object())
    {
        auto it = context.find(CORRELATION_ID_KEY);
        if (it != context.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
            return CorrelationContext(it->get<std::string>(), context);
    }
    return CorrelationContext(generate_correlation_id(), context);
}

} // namespace agentval
