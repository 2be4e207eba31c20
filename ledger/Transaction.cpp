#include "Transaction.h"

namespace cl {

namespace {

// Read a string field; absent optional fields leave `out` untouched
Roe<void> readField(const nlohmann::json &j, const char *key, std::string &out,
                    bool required) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    if (required) {
      return Error(Transaction::E_MISSING_FIELD,
                   std::string("Missing field: ") + key);
    }
    return {};
  }
  if (!it->is_string()) {
    return Error(Transaction::E_FORMAT,
                 std::string("Field must be a string: ") + key);
  }
  out = it->get<std::string>();
  return {};
}

} // namespace

const char *Transaction::typeName() const {
  return isCreation() ? TYPE_CREATION : TYPE_TRANSFER;
}

const char *Transaction::action() const {
  return isCreation() ? ACTION_CREATED : ACTION_TRANSFERRED;
}

const std::string &Transaction::custodian() const {
  return isCreation() ? actor : toActor;
}

Roe<void> Transaction::validate() const {
  if (itemId.empty()) {
    return Error(E_MISSING_FIELD, "item_id is required");
  }
  if (isCreation()) {
    if (description.empty()) {
      return Error(E_MISSING_FIELD, "description is required");
    }
    if (actor.empty()) {
      return Error(E_MISSING_FIELD, "actor is required");
    }
    if (location.empty()) {
      return Error(E_MISSING_FIELD, "location is required");
    }
    if (itemType.empty()) {
      return Error(E_MISSING_FIELD, "item_type is required");
    }
  } else {
    if (fromActor.empty()) {
      return Error(E_MISSING_FIELD, "from_actor is required");
    }
    if (toActor.empty()) {
      return Error(E_MISSING_FIELD, "to_actor is required");
    }
  }
  return {};
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["type"] = typeName();
  j["item_id"] = itemId;
  if (isCreation()) {
    j["description"] = description;
    j["actor"] = actor;
    j["location"] = location;
    j["item_type"] = itemType;
    j["content_hash"] = contentHash;
  } else {
    j["from_actor"] = fromActor;
    j["to_actor"] = toActor;
    j["reason"] = reason;
  }
  j["action"] = action();
  j["timestamp"] = timestamp;
  j["node"] = node;
  return j;
}

Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_FORMAT, "Transaction must be a JSON object");
  }

  std::string type;
  auto result = readField(j, "type", type, true);
  if (!result) {
    return result.error();
  }

  Transaction tx;
  if (type == TYPE_CREATION) {
    tx.kind = Kind::CREATION;
  } else if (type == TYPE_TRANSFER) {
    tx.kind = Kind::TRANSFER;
  } else {
    return Error(E_UNKNOWN_TYPE, "Unknown transaction type: " + type);
  }

  struct FieldSpec {
    const char *key;
    std::string *out;
    bool required;
  };

  std::vector<FieldSpec> fields = {
      {"item_id", &tx.itemId, true},
      {"timestamp", &tx.timestamp, false},
      {"node", &tx.node, false},
  };
  if (tx.isCreation()) {
    fields.push_back({"description", &tx.description, true});
    fields.push_back({"actor", &tx.actor, true});
    fields.push_back({"location", &tx.location, true});
    fields.push_back({"item_type", &tx.itemType, true});
    fields.push_back({"content_hash", &tx.contentHash, false});
  } else {
    fields.push_back({"from_actor", &tx.fromActor, true});
    fields.push_back({"to_actor", &tx.toActor, true});
    fields.push_back({"reason", &tx.reason, false});
  }

  for (const auto &field : fields) {
    auto fieldResult = readField(j, field.key, *field.out, field.required);
    if (!fieldResult) {
      return fieldResult.error();
    }
  }
  return tx;
}

} // namespace cl
