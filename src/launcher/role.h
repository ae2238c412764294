#ifndef FLOTILLA_SRC_LAUNCHER_ROLE_H_
#define FLOTILLA_SRC_LAUNCHER_ROLE_H_

#include <ostream>
#include <variant>

#include "common/core_affinity.h"

namespace Flotilla {

struct BrokerRole {};
struct ClientRole { CoreId core; };
struct CentralizedBrokerRole {};
struct MainClientRole { CoreId core; };
struct SecondaryClientRole { CoreId core; };

// What a process of the cluster is, once it has resolved it.
using Role = std::variant<BrokerRole, ClientRole, CentralizedBrokerRole, MainClientRole, SecondaryClientRole>;

inline std::ostream& operator<<(std::ostream& os, const Role& role) {
	struct Printer {
		std::ostream& os;
		void operator()(const BrokerRole&) const { os << "broker"; }
		void operator()(const ClientRole& r) const { os << "client(core " << r.core << ")"; }
		void operator()(const CentralizedBrokerRole&) const { os << "centralized broker"; }
		void operator()(const MainClientRole& r) const { os << "main client(core " << r.core << ")"; }
		void operator()(const SecondaryClientRole& r) const { os << "secondary client(core " << r.core << ")"; }
	};
	std::visit(Printer{os}, role);
	return os;
}

} // namespace Flotilla

#endif  // FLOTILLA_SRC_LAUNCHER_ROLE_H_
