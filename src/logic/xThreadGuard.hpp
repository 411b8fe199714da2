#pragma once

#include "Formatter.hpp"

#include <QThread>
#include <QObject>

#include <stdexcept>

// Throws if the current thread is not the one the guarded object lives in.
class xThreadGuard
{
public:
    xThreadGuard(const QObject* o) : xThreadGuard(o->thread())
    {}
    xThreadGuard(const QThread * thrd)
    {
        if(QThread::currentThread() != thrd)
        {
            throw std::logic_error(Formatter() << "Cross Thread Exception! Expected thread '"
                                   << (thrd ? thrd->objectName() : QString("<none>"))
                                   << "' but running in '" << QThread::currentThread()->objectName() << "'");
        }
    }
    xThreadGuard(const xThreadGuard&) = delete;
    xThreadGuard(xThreadGuard&&) = delete;
    ~xThreadGuard() = default;
};
