#include "FetchClient.h"
#include "TcpClient.h"

namespace qc {
namespace network {

FetchClient::FetchClient() : Module("qchain.network.fetch_client") {}

FetchClient::Roe<std::string>
FetchClient::fetchSync(const TcpEndpoint &endpoint, const std::string &data,
                       std::chrono::milliseconds timeout, bool expectResponse) {
  TcpClient client;
  auto connected = client.connect(endpoint, timeout);
  if (!connected) {
    return Error(E_CONNECT, connected.error().message);
  }

  auto sent = client.sendAndShutdown(data);
  if (!sent) {
    return Error(E_SEND, "Failed to send to " + endpoint.ltsToString() + ": " +
                             sent.error().message);
  }
  log().debug << "Sent " << sent.value() << " bytes to " << endpoint;

  if (!expectResponse) {
    return std::string();
  }

  auto received = client.receiveAll(maxResponseBytes_);
  if (!received) {
    return Error(E_RECEIVE, "Failed to read reply from " +
                                endpoint.ltsToString() + ": " +
                                received.error().message);
  }
  log().debug << "Received " << received.value().size() << " bytes from "
              << endpoint;
  return received.value();
}

} // namespace network
} // namespace qc
