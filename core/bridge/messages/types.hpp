/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <optional>
#include <vector>

#include "bridge/account_id.hpp"
#include "common/buffer.hpp"
#include "common/outcome_throw.hpp"
#include "primitives/common.hpp"
#include "scale/trestle_scale.hpp"
#include "storage/state_proof/state_proof.hpp"

/// Identifier of a lane, the same on both chains of the bridge
TRESTLE_BLOB_STRICT_TYPEDEF(trestle::bridge::messages, LaneId, 4);

namespace trestle::bridge::messages {

  using MessageNonce = uint64_t;
  using MessagePayload = common::Buffer;
  using Weight = uint64_t;

  /// Lanes only go forward: OPENED, CLOSING, CLOSED
  enum class LaneState : uint8_t {
    OPENED = 0,
    /// No new messages are accepted, queued ones are still delivered
    CLOSING = 1,
    CLOSED = 2,
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &encodeLaneState(Stream &s, LaneState state) {
    return s << static_cast<uint8_t>(state);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &decodeLaneState(Stream &s, LaneState &state) {
    uint8_t value = 0;
    s >> value;
    if (value > static_cast<uint8_t>(LaneState::CLOSED)) {
      common::raise(scale::DecodeError::UNEXPECTED_VALUE);
    }
    state = static_cast<LaneState>(value);
    return s;
  }

  /// Inclusive range of nonces, empty if begin > end
  struct DeliveredMessages {
    MessageNonce begin{};
    MessageNonce end{};

    static DeliveredMessages single(MessageNonce nonce) {
      return {.begin = nonce, .end = nonce};
    }

    MessageNonce totalMessages() const {
      return end >= begin ? end - begin + 1 : 0;
    }

    bool containsMessage(MessageNonce nonce) const {
      return nonce >= begin and nonce <= end;
    }

    void noteDispatchedMessage() {
      ++end;
    }

    bool operator==(const DeliveredMessages &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const DeliveredMessages &v) {
    return s << v.begin << v.end;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, DeliveredMessages &v) {
    return s >> v.begin >> v.end;
  }

  /// Relayer which delivered messages and is not rewarded for that yet
  struct UnrewardedRelayer {
    AccountId relayer;
    DeliveredMessages messages;

    bool operator==(const UnrewardedRelayer &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const UnrewardedRelayer &v) {
    return s << v.relayer << v.messages;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, UnrewardedRelayer &v) {
    return s >> v.relayer >> v.messages;
  }

  using UnrewardedRelayers = std::deque<UnrewardedRelayer>;

  constexpr size_t kMaxDecodedRelayers = 4096;

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &encodeRelayers(Stream &s, const UnrewardedRelayers &relayers) {
    s << scale::CompactInteger{relayers.size()};
    for (const auto &relayer : relayers) {
      s << relayer;
    }
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &decodeRelayers(Stream &s, UnrewardedRelayers &relayers) {
    scale::CompactInteger size;
    s >> size;
    if (size > kMaxDecodedRelayers) {
      common::raise(scale::DecodeError::TOO_MANY_ITEMS);
    }
    relayers.clear();
    for (auto i = size.convert_to<size_t>(); i > 0; --i) {
      UnrewardedRelayer relayer;
      s >> relayer;
      relayers.emplace_back(std::move(relayer));
    }
    return s;
  }

  /// Source chain side of a lane
  struct OutboundLaneData {
    /// Nonce of the oldest message, which is not pruned yet
    MessageNonce oldest_unpruned_nonce = 1;
    /// Nonce of the latest message, which delivery is confirmed
    MessageNonce latest_received_nonce = 0;
    /// Nonce of the latest sent message
    MessageNonce latest_generated_nonce = 0;
    LaneState state = LaneState::OPENED;

    /// Messages sent and not confirmed yet
    DeliveredMessages queuedMessages() const {
      return {.begin = latest_received_nonce + 1,
              .end = latest_generated_nonce};
    }

    bool operator==(const OutboundLaneData &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const OutboundLaneData &v) {
    s << v.oldest_unpruned_nonce << v.latest_received_nonce
      << v.latest_generated_nonce;
    return encodeLaneState(s, v.state);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, OutboundLaneData &v) {
    s >> v.oldest_unpruned_nonce >> v.latest_received_nonce
        >> v.latest_generated_nonce;
    return decodeLaneState(s, v.state);
  }

  /// Target chain side of a lane
  struct InboundLaneData {
    /// Relayers of the delivered messages, in delivery order. Ranges of
    /// the entries are consecutive and do not overlap.
    UnrewardedRelayers relayers;
    /// Nonce of the latest message, which delivery is confirmed at the
    /// source chain
    MessageNonce last_confirmed_nonce = 0;
    LaneState state = LaneState::OPENED;

    MessageNonce lastDeliveredNonce() const {
      if (relayers.empty()) {
        return last_confirmed_nonce;
      }
      return relayers.back().messages.end;
    }

    bool operator==(const InboundLaneData &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const InboundLaneData &v) {
    encodeRelayers(s, v.relayers);
    s << v.last_confirmed_nonce;
    return encodeLaneState(s, v.state);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, InboundLaneData &v) {
    decodeRelayers(s, v.relayers);
    s >> v.last_confirmed_nonce;
    return decodeLaneState(s, v.state);
  }

  /// Summary of the inbound lane relayers, declared by the relayer
  /// confirming delivery, so the cost of the call is known in advance
  struct UnrewardedRelayersState {
    MessageNonce unrewarded_relayer_entries = 0;
    MessageNonce messages_in_oldest_entry = 0;
    MessageNonce total_messages = 0;
    MessageNonce last_delivered_nonce = 0;

    static UnrewardedRelayersState from(const InboundLaneData &data);

    /// True if the declared state matches the proven lane data
    bool isValid(const InboundLaneData &data) const {
      return *this == from(data);
    }

    bool operator==(const UnrewardedRelayersState &rhs) const = default;
  };

  struct MessageKey {
    LaneId lane_id;
    MessageNonce nonce{};

    bool operator==(const MessageKey &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const MessageKey &v) {
    return s << v.lane_id << v.nonce;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, MessageKey &v) {
    return s >> v.lane_id >> v.nonce;
  }

  struct Message {
    MessageKey key;
    MessagePayload payload;

    bool operator==(const Message &rhs) const = default;
  };

  /// Messages of one lane with an optional state of the outbound lane,
  /// as read from a messages proof
  struct ProvedLaneMessages {
    std::optional<OutboundLaneData> lane_state;
    std::vector<Message> messages;
  };

  struct SendMessageArtifacts {
    MessageNonce nonce{};
    /// Messages in the queue, the sent one included
    MessageNonce enqueued_messages{};

    bool operator==(const SendMessageArtifacts &rhs) const = default;
  };

  enum class ReceptionResult : uint8_t {
    DISPATCHED,
    INVALID_NONCE,
    TOO_MANY_UNREWARDED_RELAYERS,
    TOO_MANY_UNCONFIRMED_MESSAGES,
  };

  /// Results of messages delivered by one call
  struct ReceivedMessages {
    LaneId lane;
    std::vector<std::pair<MessageNonce, ReceptionResult>> receive_results;
  };

  /**
   * Messages of the source chain lane in the nonces range, proven at a
   * finalized header of the source chain
   */
  struct MessagesProof {
    primitives::BlockHash bridged_header_hash;
    storage::StateProof storage_proof;
    LaneId lane;
    MessageNonce nonces_start{};
    MessageNonce nonces_end{};

    bool operator==(const MessagesProof &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const MessagesProof &v) {
    return s << v.bridged_header_hash << v.storage_proof << v.lane
             << v.nonces_start << v.nonces_end;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, MessagesProof &v) {
    return s >> v.bridged_header_hash >> v.storage_proof >> v.lane
        >> v.nonces_start >> v.nonces_end;
  }

  /**
   * Inbound lane data of the target chain, proven at a finalized header of
   * the target chain
   */
  struct MessagesDeliveryProof {
    primitives::BlockHash bridged_header_hash;
    storage::StateProof storage_proof;
    LaneId lane;

    bool operator==(const MessagesDeliveryProof &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const MessagesDeliveryProof &v) {
    return s << v.bridged_header_hash << v.storage_proof << v.lane;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, MessagesDeliveryProof &v) {
    return s >> v.bridged_header_hash >> v.storage_proof >> v.lane;
  }

  enum class MessagesOperatingMode : uint8_t {
    NORMAL = 0,
    /// Messages are delivered and confirmed, new ones are not accepted
    REJECTING_OUTBOUND_MESSAGES = 1,
    HALTED = 2,
  };

  struct MessagesConfig {
    /// Max size of an encoded message payload
    uint32_t max_message_size = 64 * 1024;
    /// Bound of the relayers queue of an inbound lane
    MessageNonce max_unrewarded_relayer_entries = 16;
    /// Bound of messages delivered and not confirmed on an inbound lane
    MessageNonce max_unconfirmed_messages = 128;
    /// Max messages one delivery call may bring
    MessageNonce max_messages_in_proof = 128;
  };

}  // namespace trestle::bridge::messages

template <>
struct fmt::formatter<trestle::bridge::messages::DeliveredMessages> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const trestle::bridge::messages::DeliveredMessages &range,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}..={}", range.begin, range.end);
  }
};
