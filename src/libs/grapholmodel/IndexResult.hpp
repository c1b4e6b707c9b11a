// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"

#include <QtCore/QString>

#include <utility>

namespace GrapholModel {

enum class IndexErrorCode : quint8 {
	None = 0,
	InvalidArgument,
	ForeignReference,
	ConflictingSelector
};

class GRAPHOLMODEL_EXPORT IndexError final {
public:
	IndexError() = default;
	IndexError(IndexErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == IndexErrorCode::None; }
	IndexErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	static IndexError none() { return {}; }

private:
	IndexErrorCode m_code{IndexErrorCode::None};
	QString m_message;
};

// Outcome of an index mutation. A successful call that found nothing to do
// (idempotent add/remove) is ok() but not changed().
class GRAPHOLMODEL_EXPORT IndexResult final {
public:
	IndexResult() = default;

	static IndexResult applied()
	{
		IndexResult r;
		r.m_changed = true;
		return r;
	}

	static IndexResult unchanged() { return IndexResult{}; }

	static IndexResult failure(IndexError err)
	{
		IndexResult r;
		r.m_ok = false;
		r.m_error = std::move(err);
		return r;
	}

	bool ok() const noexcept { return m_ok; }
	bool changed() const noexcept { return m_changed; }
	const IndexError& error() const noexcept { return m_error; }

	explicit operator bool() const noexcept { return m_ok; }

private:
	bool m_ok{true};
	bool m_changed{false};
	IndexError m_error{IndexError::none()};
};

class GRAPHOLMODEL_EXPORT CountResult final {
public:
	CountResult() = default;

	static CountResult success(int value)
	{
		CountResult r;
		r.m_value = value;
		return r;
	}

	static CountResult failure(IndexError err)
	{
		CountResult r;
		r.m_ok = false;
		r.m_error = std::move(err);
		return r;
	}

	bool ok() const noexcept { return m_ok; }
	int value() const noexcept { return m_value; }
	const IndexError& error() const noexcept { return m_error; }

private:
	bool m_ok{true};
	int m_value{0};
	IndexError m_error{IndexError::none()};
};

} // namespace GrapholModel
