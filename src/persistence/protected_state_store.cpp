#include "persistence/protected_state_store.hpp"

#include "persistence/base64.hpp"

#include <stdexcept>

namespace cstate::persistence {

namespace {

std::unique_ptr<crypto::DataProtector> make_protector(
    const crypto::DataProtectionProvider& provider, const std::string& purpose)
{
    auto protector = provider.create_protector(purpose);
    if (!protector) {
        throw std::runtime_error("ProtectedStateStore: provider returned no protector");
    }
    return protector;
}

} // anonymous namespace

ProtectedStateStore::ProtectedStateStore(const crypto::DataProtectionProvider& provider,
                                         const std::string& purpose,
                                         BufferPool& pool)
    : PrerenderStateStore(pool)
    , protector_(make_protector(provider, purpose))
{}

ProtectedStateStore::ProtectedStateStore(std::string_view existing_state,
                                         const crypto::DataProtectionProvider& provider,
                                         const std::string& purpose,
                                         BufferPool& pool)
    : PrerenderStateStore(Deferred{}, pool)
    , protector_(make_protector(provider, purpose))
{
    const auto sealed = base64_decode(existing_state);
    const auto framed = protector_->unprotect(ByteView{sealed});
    deserialize_state(ByteView{framed});
}

PooledBufferWriter ProtectedStateStore::serialize_state(const StateSnapshot& state) {
    auto plain = PrerenderStateStore::serialize_state(state);
    auto sealed = protector_->protect(plain.written());
    // The plaintext frame goes back to the pool before the sealed copy is
    // handed out.
    plain.release();
    return PooledBufferWriter(ByteView{sealed}, pool());
}

} // namespace cstate::persistence
