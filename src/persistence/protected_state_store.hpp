#pragma once

#include "crypto/data_protector.hpp"
#include "persistence/prerender_state_store.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cstate::persistence {

// ── ProtectedStateStore ──────────────────────────────────────────────────────
//
// PrerenderStateStore whose transport string is base64 of a protected CSTF
// frame, so the client holding it can neither read nor forge the state.
//
// Restore failures are split by cause: AuthenticationError when the payload
// does not verify under this purpose, MalformedStateError when it verifies
// but the frame inside (or the outer base64) is bad.

class ProtectedStateStore final : public PrerenderStateStore {
public:
    static constexpr const char* kPurpose = "cstate.server.component-state";

    explicit ProtectedStateStore(const crypto::DataProtectionProvider& provider,
                                 const std::string& purpose = kPurpose,
                                 BufferPool& pool = BufferPool::shared());

    ProtectedStateStore(std::string_view existing_state,
                        const crypto::DataProtectionProvider& provider,
                        const std::string& purpose = kPurpose,
                        BufferPool& pool = BufferPool::shared());

    [[nodiscard]] const std::string& purpose() const noexcept {
        return protector_->purpose();
    }

protected:
    [[nodiscard]] PooledBufferWriter serialize_state(const StateSnapshot& state) override;

private:
    std::unique_ptr<crypto::DataProtector> protector_;
};

} // namespace cstate::persistence
