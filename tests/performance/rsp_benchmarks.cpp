#include <benchmark/benchmark.h>
#include <rsp/crypto/openssl_provider.h>
#include <rsp/crypto/crypto_utils.h>
#include <rsp/crypto/ecdh.h>
#include <rsp/crypto/kdf.h>
#include <rsp/protocol/psk_cipher.h>
#include <rsp/protocol/scp03t.h>
#include <memory>

using namespace rsp;

namespace {

std::unique_ptr<crypto::OpenSSLProvider> make_provider(benchmark::State& state) {
    auto provider = std::make_unique<crypto::OpenSSLProvider>();
    if (!provider->is_available() || !provider->initialize()) {
        state.SkipWithError("OpenSSL provider not available");
        return nullptr;
    }
    return provider;
}

std::vector<uint8_t> pattern(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(seed + i);
    }
    return data;
}

} // namespace

static void BM_DeriveProfileKeys(benchmark::State& state) {
    auto provider = make_provider(state);
    if (!provider) {
        return;
    }
    const auto secret = pattern(32, 0x10);

    for (auto _ : state) {
        auto keys = crypto::derive_profile_keys(*provider, secret);
        if (!keys) {
            state.SkipWithError("Key derivation failed");
            return;
        }
        benchmark::DoNotOptimize(keys.value());
    }
}
BENCHMARK(BM_DeriveProfileKeys);

static void BM_BuildInstallApdu(benchmark::State& state) {
    auto provider = make_provider(state);
    if (!provider) {
        return;
    }
    const auto aid = pattern(11, 0xA0);
    const auto segment = pattern(static_cast<size_t>(state.range(0)), 0x00);
    const auto s_enc = pattern(16, 0x20);
    const auto s_mac = pattern(16, 0x30);
    uint32_t counter = 1;

    for (auto _ : state) {
        auto apdu = protocol::scp03t::build_install_apdu(*provider, aid, segment, s_enc, s_mac, counter++);
        if (!apdu) {
            state.SkipWithError("APDU construction failed");
            return;
        }
        benchmark::DoNotOptimize(apdu.value());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_BuildInstallApdu)->Arg(64)->Arg(1024);

static void BM_PskEncrypt(benchmark::State& state) {
    auto provider = make_provider(state);
    if (!provider) {
        return;
    }
    const auto psk = pattern(static_cast<size_t>(state.range(0)), 0x40);
    const nlohmann::json command = {
        {"command", "load_segment"},
        {"isdpAid", "A0000005591010DEADBEEF"},
        {"apdu", crypto::utils::to_hex(pattern(512, 0x00), true)}
    };

    for (auto _ : state) {
        auto payload = protocol::psk_cipher::encrypt(*provider, command, psk);
        if (!payload) {
            state.SkipWithError("PSK encryption failed");
            return;
        }
        benchmark::DoNotOptimize(payload.value());
    }
}
BENCHMARK(BM_PskEncrypt)->Arg(16)->Arg(32);

static void BM_EcdhAgreement(benchmark::State& state) {
    auto provider = make_provider(state);
    if (!provider) {
        return;
    }
    auto peer = crypto::generate_keypair(*provider);
    if (!peer) {
        state.SkipWithError("Key generation failed");
        return;
    }

    for (auto _ : state) {
        auto local = crypto::generate_keypair(*provider);
        if (!local) {
            state.SkipWithError("Key generation failed");
            return;
        }
        auto secret = crypto::compute_shared_secret(*provider, *local->private_key(), peer->public_point());
        if (!secret) {
            state.SkipWithError("ECDH failed");
            return;
        }
        benchmark::DoNotOptimize(secret.value());
    }
}
BENCHMARK(BM_EcdhAgreement);
