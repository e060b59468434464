#include <meshdest/destination/resolver.h>

namespace meshdest::destination {

std::shared_ptr<IResolver> SelectResolver(const ResolverList& resolvers, const Destination& dst) {
    for (const auto& r : resolvers) {
        if (r && r->CanResolve(dst)) {
            return r;
        }
    }
    return nullptr;
}

} // namespace meshdest::destination
