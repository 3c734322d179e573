#include "curve_state.hpp"
#include "curve_errors.hpp"

namespace bonding_curve {

CurveState launch_curve(
    const AssetId& asset_id,
    const AccountId& creator_id,
    Amount virtual_base_reserve,
    Amount virtual_asset_reserve,
    Timestamp now,
    Amount initial_real_asset_reserve
) {
    if (virtual_base_reserve == 0 || virtual_asset_reserve == 0) {
        throw CurveError(ErrorCode::InvalidInitialReserves);
    }
    CurveState curve;
    curve.asset_id = asset_id;
    curve.creator_id = creator_id;
    curve.virtual_base_reserve = virtual_base_reserve;
    curve.virtual_asset_reserve = virtual_asset_reserve;
    curve.real_base_reserve = 0;
    curve.real_asset_reserve = initial_real_asset_reserve;
    curve.initial_real_asset_reserve = initial_real_asset_reserve;
    curve.assets_sold = 0;
    curve.graduated = false;
    curve.created_at = now;
    curve.graduated_at = 0;
    return curve;
}

CurveState launch_curve(
    const GlobalPolicy& policy,
    const AssetDescriptor& descriptor,
    const AccountId& creator_id,
    Amount virtual_base_reserve,
    Amount virtual_asset_reserve,
    Timestamp now
) {
    if (policy.paused) {
        throw CurveError(ErrorCode::ProtocolPaused);
    }
    validate_descriptor(descriptor);
    return launch_curve(descriptor.asset_id, creator_id,
                        virtual_base_reserve, virtual_asset_reserve, now);
}

void validate_descriptor(const AssetDescriptor& descriptor) {
    if (descriptor.name.empty() || descriptor.name.size() > MAX_NAME_LENGTH) {
        throw CurveError(ErrorCode::InvalidNameLength);
    }
    if (descriptor.symbol.empty() || descriptor.symbol.size() > MAX_SYMBOL_LENGTH) {
        throw CurveError(ErrorCode::InvalidSymbolLength);
    }
    if (descriptor.uri.size() > MAX_URI_LENGTH) {
        throw CurveError(ErrorCode::InvalidUriLength);
    }
}

void check_invariants(const CurveState& curve) {
    if (curve.graduated) {
        if (curve.real_base_reserve != 0 || curve.real_asset_reserve != 0) {
            throw CurveError(ErrorCode::InvalidCurveState, "graduated curve holds real reserves");
        }
        return;
    }
    if (curve.virtual_base_reserve == 0 || curve.virtual_asset_reserve == 0) {
        throw CurveError(ErrorCode::InvalidCurveState, "zero virtual reserve on active curve");
    }
    if (curve.real_asset_reserve > curve.initial_real_asset_reserve) {
        throw CurveError(ErrorCode::InvalidCurveState, "real asset above launch allocation");
    }
    // real <= initial holds here, so the difference cannot wrap
    if (curve.assets_sold != curve.initial_real_asset_reserve - curve.real_asset_reserve) {
        throw CurveError(ErrorCode::InvalidCurveState, "sold and held asset do not add up");
    }
}

} // namespace bonding_curve
