#include "searxmcp/util/uuid.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace searxmcp::util
{

std::string generate_uuid4()
{
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    // version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (high >> 32) << '-';
    oss << std::setw(4) << ((high >> 16) & 0xFFFF) << '-';
    oss << std::setw(4) << (high & 0xFFFF) << '-';
    oss << std::setw(4) << (low >> 48) << '-';
    oss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace searxmcp::util
