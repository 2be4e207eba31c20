#ifndef CHAIN_LEDGER_TRANSACTION_H
#define CHAIN_LEDGER_TRANSACTION_H

#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>
#include <string>

namespace cl {

/**
 * Custody event: either the creation of a tracked item or its transfer
 * between two actors. Only the fields of the active kind are meaningful.
 */
struct Transaction {
  enum class Kind { CREATION, TRANSFER };

  static constexpr const char *TYPE_CREATION = "item_creation";
  static constexpr const char *TYPE_TRANSFER = "item_transfer";
  static constexpr const char *ACTION_CREATED = "Created";
  static constexpr const char *ACTION_TRANSFERRED = "Transferred";

  static constexpr const int32_t E_FORMAT = 1;
  static constexpr const int32_t E_MISSING_FIELD = 2;
  static constexpr const int32_t E_UNKNOWN_TYPE = 3;

  Kind kind{ Kind::CREATION };
  std::string itemId;

  // Creation
  std::string description;
  std::string actor;
  std::string location;
  std::string itemType;
  std::string contentHash;

  // Transfer
  std::string fromActor;
  std::string toActor;
  std::string reason;

  std::string timestamp; // ISO-8601, local time of the originating node
  std::string node;      // originating node id

  bool isCreation() const { return kind == Kind::CREATION; }
  bool isTransfer() const { return kind == Kind::TRANSFER; }

  const char *typeName() const;
  const char *action() const;

  // Holder after this event: actor for a creation, to_actor for a transfer
  const std::string &custodian() const;

  /**
   * Check required fields. item_id and the kind's actor fields must be
   * non-empty; a creation also needs description, location and item_type.
   */
  Roe<void> validate() const;

  nlohmann::json toJson() const;

  /**
   * Parse the wire form. The "type" tag selects the kind; every field of that
   * kind must be present as a string (reason may be empty).
   */
  static Roe<Transaction> fromJson(const nlohmann::json &j);
};

} // namespace cl

#endif // CHAIN_LEDGER_TRANSACTION_H
