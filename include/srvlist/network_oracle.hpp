#pragma once

namespace srvlist {

class NetworkOracle {
  public:
    virtual ~NetworkOracle() = default;

    virtual bool is_network_available() const = 0;

    virtual bool is_offline_mode_enabled() const = 0;
};

// Network is available when at least one non-loopback interface is up and
// running with an IPv4 or IPv6 address. Offline mode comes from
// configuration.
class SystemNetworkOracle final : public NetworkOracle {
  private:
    bool m_offline_mode;

  public:
    explicit SystemNetworkOracle(bool offline_mode) noexcept;

    bool is_network_available() const override;

    bool is_offline_mode_enabled() const override;
};

} // namespace srvlist
