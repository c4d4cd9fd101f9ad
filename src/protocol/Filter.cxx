// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Filter.hxx"
#include "Quote.hxx"

#include <cassert>
#include <iterator>

std::string
TagQueryFilter::ToExpression() const noexcept
{
	return std::string("(") + tag + " " + op + " "
		+ QuoteFilterValue(value) + ")";
}

std::string
AndQueryFilter::ToExpression() const noexcept
{
	assert(!items.empty());

	auto i = items.begin();
	const auto end = items.end();

	if (std::next(i) == end)
		return (*i)->ToExpression();

	std::string e("(");
	e += (*i)->ToExpression();

	for (++i; i != end; ++i) {
		e += " AND ";
		e += (*i)->ToExpression();
	}

	e.push_back(')');
	return e;
}

std::string
QuoteFilter(const QueryFilter &filter) noexcept
{
	return QuoteArgument(filter.ToExpression());
}

std::string
QuoteTagFilter(std::string_view tag, std::string_view value,
	       const char *op) noexcept
{
	return QuoteFilter(TagQueryFilter(tag, value, op));
}
