#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport/ble_driver.hpp"
#include "util/error.hpp"

namespace app
{

// Maps a peer id to its static X25519 public key.
struct IdentityResolver
{
    virtual std::optional<std::vector<std::uint8_t>> resolve(const transport::DeviceId &peer) = 0;
    virtual ~IdentityResolver() = default;
};

// Keys from configuration: "AA:BB:CC:DD:EE:FF=<64 hex>,merchant=<64 hex>".
// Ids compare case-insensitively.
class StaticIdentityResolver final : public IdentityResolver
{
  public:
    bool parse(const std::string &text, txrelay::Error &err);
    void add(const transport::DeviceId &peer, std::vector<std::uint8_t> public_raw);

    std::optional<std::vector<std::uint8_t>> resolve(const transport::DeviceId &peer) override;

    std::size_t size() const;

  private:
    mutable std::mutex                                   mu_;
    std::map<std::string, std::vector<std::uint8_t>>     keys_;
};

}  // namespace app
