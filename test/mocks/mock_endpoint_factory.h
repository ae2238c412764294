#ifndef FLOTILLA_TEST_MOCKS_MOCK_ENDPOINT_FACTORY_H_
#define FLOTILLA_TEST_MOCKS_MOCK_ENDPOINT_FACTORY_H_

#include <gmock/gmock.h>
#include "transport/endpoint_builder.h"

namespace Flotilla {

class MockEndpointFactory : public EndpointFactory {
public:
    MOCK_METHOD(ClientLaunch, LaunchClient, (const ClientOptions& options), (override));
    MOCK_METHOD(void, RunBroker, (const BrokerOptions& options), (override));
    MOCK_METHOD(void, RunCentralizedBroker, (const CentralizedBrokerOptions& options), (override));
    MOCK_METHOD(std::unique_ptr<EventManager>, WrapCentralized,
            (std::unique_ptr<EventManager> inner, const CentralizedClientOptions& options), (override));
};

} // namespace Flotilla

#endif  // FLOTILLA_TEST_MOCKS_MOCK_ENDPOINT_FACTORY_H_
