#include "merklegate/keccak.hpp"

// Keccak-256 reference implementation (portable C++)
// Sponge over Keccak-f[1600] with rate 136 bytes and capacity 512 bits

namespace {

constexpr size_t KECCAK_RATE = 136;
constexpr size_t KECCAK_ROUNDS = 24;
constexpr uint8_t KECCAK_DOMAIN = 0x01;

constexpr uint64_t ROUND_CONSTANTS[KECCAK_ROUNDS] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rho offsets and pi lane order, walked together in the combined rho-pi step
constexpr unsigned RHO_OFFSETS[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

constexpr unsigned PI_LANES[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

inline uint64_t rotl64(uint64_t x, unsigned n) {
    return (x << n) | (x >> (64 - n));
}

inline uint64_t load64_le(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline void store64_le(uint8_t* p, uint64_t x) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(x >> (8 * i));
    }
}

void keccak_f1600(uint64_t st[25]) {
    uint64_t bc[5];

    for (size_t round = 0; round < KECCAK_ROUNDS; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            unsigned j = PI_LANES[i];
            uint64_t tmp = st[j];
            st[j] = rotl64(t, RHO_OFFSETS[i]);
            t = tmp;
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= ROUND_CONSTANTS[round];
    }
}

struct keccak_state {
    uint64_t lanes[25];
    uint8_t buf[KECCAK_RATE];
    size_t buf_len;
};

void state_init(keccak_state* self) {
    for (auto& lane : self->lanes) lane = 0;
    self->buf_len = 0;
}

void absorb_block(keccak_state* self, const uint8_t* block) {
    for (size_t i = 0; i < KECCAK_RATE / 8; ++i) {
        self->lanes[i] ^= load64_le(block + i * 8);
    }
    keccak_f1600(self->lanes);
}

void state_update(keccak_state* self, const uint8_t* input, size_t input_len) {
    // Top up a partially filled buffer first
    if (self->buf_len > 0) {
        size_t take = KECCAK_RATE - self->buf_len;
        if (take > input_len) take = input_len;
        for (size_t i = 0; i < take; ++i) {
            self->buf[self->buf_len + i] = input[i];
        }
        self->buf_len += take;
        input += take;
        input_len -= take;

        if (self->buf_len == KECCAK_RATE) {
            absorb_block(self, self->buf);
            self->buf_len = 0;
        }
    }

    while (input_len >= KECCAK_RATE) {
        absorb_block(self, input);
        input += KECCAK_RATE;
        input_len -= KECCAK_RATE;
    }

    for (size_t i = 0; i < input_len; ++i) {
        self->buf[i] = input[i];
    }
    self->buf_len += input_len;
}

void state_finalize(keccak_state* self, uint8_t out[32]) {
    // pad10*1 with the Keccak domain byte
    for (size_t i = self->buf_len; i < KECCAK_RATE; ++i) {
        self->buf[i] = 0;
    }
    self->buf[self->buf_len] ^= KECCAK_DOMAIN;
    self->buf[KECCAK_RATE - 1] ^= 0x80;
    absorb_block(self, self->buf);

    for (int i = 0; i < 4; ++i) {
        store64_le(&out[i * 8], self->lanes[i]);
    }
}

} // anonymous namespace

namespace merklegate {

Digest Keccak256Hasher::hash(std::span<const uint8_t> data) noexcept {
    keccak_state state;
    state_init(&state);
    state_update(&state, data.data(), data.size());

    Digest result;
    state_finalize(&state, result.bytes.data());
    return result;
}

Digest Keccak256Hasher::hash(std::string_view str) noexcept {
    return hash(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

Digest Keccak256Hasher::hash_concat(const Digest& a, const Digest& b) noexcept {
    keccak_state state;
    state_init(&state);
    state_update(&state, a.data(), Digest::size());
    state_update(&state, b.data(), Digest::size());

    Digest result;
    state_finalize(&state, result.bytes.data());
    return result;
}

// Incremental hasher implementation
struct Keccak256Hasher::Incremental::Impl {
    keccak_state state;
};

Keccak256Hasher::Incremental::Incremental() noexcept
    : impl_(std::make_unique<Impl>()) {
    state_init(&impl_->state);
}

Keccak256Hasher::Incremental::~Incremental() = default;

Keccak256Hasher::Incremental::Incremental(Incremental&&) noexcept = default;
Keccak256Hasher::Incremental& Keccak256Hasher::Incremental::operator=(Incremental&&) noexcept = default;

void Keccak256Hasher::Incremental::update(std::span<const uint8_t> data) noexcept {
    state_update(&impl_->state, data.data(), data.size());
}

void Keccak256Hasher::Incremental::update(std::string_view str) noexcept {
    state_update(&impl_->state, reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

Digest Keccak256Hasher::Incremental::finalize() noexcept {
    Digest result;
    state_finalize(&impl_->state, result.bytes.data());
    state_init(&impl_->state);
    return result;
}

void Keccak256Hasher::Incremental::reset() noexcept {
    state_init(&impl_->state);
}

} // namespace merklegate
