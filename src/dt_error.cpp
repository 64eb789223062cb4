#include "dt_error.hpp"

#include <string>

namespace dt_error {

TableNotFound::TableNotFound(const std::string &schema_name_,
                             const std::string &table_name_)
    : TableAccessError("Table <" + table_name_ + "> does not exist in schema <" +
                       schema_name_ + ">"),
      schema_name(schema_name_), table_name(table_name_) {}

NoPrimaryKey::NoPrimaryKey(const std::string &table_name_)
    : TableAccessError("No primary key found for table <" + table_name_ + ">"),
      table_name(table_name_) {}

MissingMatchField::MissingMatchField(const std::string &table_name_,
                                     const std::string &field_,
                                     std::size_t record_index)
    : TableAccessError("Record " + std::to_string(record_index) +
                       " for table <" + table_name_ +
                       "> is missing match field <" + field_ + ">"),
      table_name(table_name_), field(field_) {}

ColumnAlreadyExists::ColumnAlreadyExists(const std::string &table_name_,
                                         const std::string &column_name_)
    : TableAccessError("Column <" + column_name_ +
                       "> already exists in table <" + table_name_ + ">"),
      table_name(table_name_), column_name(column_name_) {}

UnknownColumn::UnknownColumn(const std::string &table_name_,
                             const std::string &column_name_)
    : TableAccessError("Column <" + column_name_ +
                       "> does not exist in table <" + table_name_ + ">"),
      table_name(table_name_), column_name(column_name_) {}

UnsafeValue::UnsafeValue(const std::string &field_, const std::string &reason)
    : TableAccessError("Unsafe filter on field <" + field_ + ">: " + reason),
      field(field_) {}

InvalidPredicate::InvalidPredicate(const std::string &field_,
                                   const std::string &reason)
    : TableAccessError("Invalid predicate on field <" + field_ + ">: " +
                       reason),
      field(field_) {}

} // namespace dt_error
