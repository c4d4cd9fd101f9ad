// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <list>
#include <utility>

/**
 * A filter expression for the "find" and "playlistfind" commands.
 */
class QueryFilter {
public:
	virtual ~QueryFilter() noexcept = default;

	/**
	 * Convert this object to a filter expression (unquoted).
	 */
	virtual std::string ToExpression() const noexcept = 0;
};

using QueryFilterPtr = std::unique_ptr<QueryFilter>;

/**
 * Compares one tag with a value, e.g. "(artist == 'Foo')".
 */
class TagQueryFilter final : public QueryFilter {
	std::string tag;

	const char *op;

	std::string value;

public:
	/**
	 * @param _op the comparison operator, e.g. "==", "!=",
	 * "contains"
	 */
	template<typename T, typename V>
	TagQueryFilter(T &&_tag, V &&_value, const char *_op="==")
		:tag(std::forward<T>(_tag)), op(_op),
		 value(std::forward<V>(_value)) {}

	/* virtual methods from QueryFilter */
	std::string ToExpression() const noexcept override;
};

/**
 * Matches only if all items match.
 */
class AndQueryFilter final : public QueryFilter {
	std::list<QueryFilterPtr> items;

public:
	bool IsEmpty() const noexcept {
		return items.empty();
	}

	void AddItem(QueryFilterPtr &&item) noexcept {
		items.emplace_back(std::move(item));
	}

	template<typename T, typename V>
	void AddTag(T &&tag, V &&value, const char *op="==") {
		AddItem(std::make_unique<TagQueryFilter>(std::forward<T>(tag),
							 std::forward<V>(value),
							 op));
	}

	/* virtual methods from QueryFilter */
	std::string ToExpression() const noexcept override;
};

/**
 * Convert the filter to an expression and quote it so it can be
 * passed as a command argument.
 */
[[gnu::pure]]
std::string
QuoteFilter(const QueryFilter &filter) noexcept;

/**
 * Shortcut for QuoteFilter(TagQueryFilter(tag, value, op)).
 */
[[gnu::pure]]
std::string
QuoteTagFilter(std::string_view tag, std::string_view value,
	       const char *op="==") noexcept;
