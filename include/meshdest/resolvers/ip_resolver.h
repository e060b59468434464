#pragma once

#include <meshdest/destination/resolver.h>
#include <meshdest/resolvers/resolver_options.h>

namespace meshdest::resolvers {

// Destinations whose host is an IPv4 or IPv6 literal resolve to themselves.
class IpResolver final : public destination::IResolver {
public:
    explicit IpResolver(ResolverOptions options = {});

    std::string_view Name() const override { return "ip"; }
    bool CanResolve(const destination::Destination& dst) const override;
    Status StreamResolution(const destination::Destination& dst, const destination::EmitFn& emit,
                            const destination::DoneSignal& done) override;

private:
    const ResolverOptions options_;
};

} // namespace meshdest::resolvers
