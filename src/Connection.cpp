#include "Connection.hpp"
#include <atomic>
#include <random>
#include <sstream>

namespace mcpperf {

Connection::Connection(std::string id)
    : m_id(std::move(id))
    , m_createdAt(std::chrono::steady_clock::now()) {
}

std::string generateConnectionId() {
    static std::atomic<uint64_t> sequence{0};
    thread_local std::mt19937 rng{std::random_device{}()};

    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream id;
    id << "conn-" << ++sequence << "-" << std::hex << dist(rng);
    return id.str();
}

}  // namespace mcpperf
