#pragma once
#include <atomic>
#include <string>

#include "transport/itransport.hpp"

namespace transport {

class LoopbackTransport final : public ITransport {
public:
  bool        start(const Settings& s, OnChunk on_rx, OnLink on_link) override;
  void        stop() override;
  bool        link_ready() const override;
  std::string name() const override { return "loopback"; }

  // Act as the peer: push one notification chunk / drop the link.
  bool deliver(const Chunk& chunk);
  void drop_link(const std::string& detail = "loopback link dropped");

private:
  OnChunk           on_rx_{};
  OnLink            on_link_{};
  std::atomic<bool> started_{false};
};

} // namespace transport
