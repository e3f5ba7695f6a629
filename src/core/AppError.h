#pragma once

#include <QString>
#include <QDebug>

// Single reported-error kind surfaced to the user. The kind tag is for
// logging and tests only; the message is what reaches the alert.
struct AppError {
    enum class Kind {
        WebApi,       // returned by the playlist service
        Validation,   // rejected before any service call
        Io,           // catalogue file could not be read
        Parse         // catalogue / wire JSON malformed
    };

    Kind    kind = Kind::WebApi;
    QString message;

    static AppError webApi(const QString& message)     { return {Kind::WebApi, message}; }
    static AppError validation(const QString& message) { return {Kind::Validation, message}; }
    static AppError io(const QString& message)         { return {Kind::Io, message}; }
    static AppError parse(const QString& message)      { return {Kind::Parse, message}; }

    bool operator==(const AppError& other) const
    {
        return kind == other.kind && message == other.message;
    }
    bool operator!=(const AppError& other) const { return !(*this == other); }
};

QString appErrorKindName(AppError::Kind kind);

QDebug operator<<(QDebug dbg, const AppError& error);
