/* Class CastorCommandLine
*
* This file is part of the Castor project.
*
* Copyright (C) Mark Kendall 2013
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Std
#include <iostream>

// Qt
#include <QMap>
#include <QHash>
#include <QStringList>
#include <QCoreApplication>

// Castor
#include "castorversion.h"
#include "castorexitcodes.h"
#include "castorcommandline.h"

/*! \class CastorArgument
 *  \brief Simple wrapper around a command line argument.
 *
 * The QVariant described by m_value indicates the type accepted by the argument. An
 * invalid QVariant indicates that the argument is an option only (e.g. --help) and requires
 * no value. When a value is detected in the command line, m_value is updated accordingly for
 * later retrieval, or is set to true for options to indicate the option was detected.
*/
class CastorArgument
{
  public:
    CastorArgument()
      : m_value(QVariant()),
        m_exitImmediately(true),
        m_flags(CastorCommandLine::None)
    {
    }

    CastorArgument(const QVariant &Default, CastorCommandLine::Options Flags, bool Exit)
      : m_value(Default),
        m_exitImmediately(Exit),
        m_flags(Flags)
    {
    }

    QVariant                   m_value;
    bool                       m_exitImmediately;
    CastorCommandLine::Options m_flags;
};

class CastorCommandLinePriv
{
  public:
    explicit CastorCommandLinePriv(CastorCommandLine::Options Flags);

    int         Evaluate       (int argc, const char * const *argv, bool &Exit);
    void        Add            (const QString &Keys, const QVariant &Default, const QString &HelpText,
                                CastorCommandLine::Options Flags = CastorCommandLine::None, bool ExitImmediately = false);
    QVariant    GetValue       (const QString &Key);

  private:
    void        PrintHelp      (void);

  private:
    QHash<QString,CastorArgument> m_options;
    QHash<QString,QString>        m_aliases;
    QMap<QString,QString>         m_help;
    int                           m_maxLength;
};

CastorCommandLinePriv::CastorCommandLinePriv(CastorCommandLine::Options Flags)
  : m_maxLength(0)
{
    // always enable version, help and logging
    CastorCommandLine::Options options = Flags | CastorCommandLine::Version | CastorCommandLine::Help |
                                         CastorCommandLine::LogLevel | CastorCommandLine::LogType;

    if (options.testFlag(CastorCommandLine::Help))
        Add("h,help", QVariant(), "Display full usage information.", CastorCommandLine::Help, true);
    if (options.testFlag(CastorCommandLine::LogType))
        Add("v,verbose", QString("general"), "Set the logging type (e.g. general,upnp).", CastorCommandLine::None);
    if (options.testFlag(CastorCommandLine::LogLevel))
        Add("l,loglevel", QString("info"), "Set the logging level.", CastorCommandLine::None);
    if (options.testFlag(CastorCommandLine::Version))
        Add("version", QVariant(), "Display version information.", CastorCommandLine::Version, true);
    if (options.testFlag(CastorCommandLine::LogFile))
        Add("logfile", QString(""), "Also log to the given file.", CastorCommandLine::None);
}

/// \brief Add a command line option
void CastorCommandLinePriv::Add(const QString &Keys, const QVariant &Default, const QString &HelpText,
                                CastorCommandLine::Options Flags, bool ExitImmediately)
{
    QStringList keys = Keys.split(",", QString::SkipEmptyParts);
    QStringList valid;
    QString master;

    foreach (const QString &key, keys)
    {
        if (key.contains("="))
        {
            std::cout << QString("Invalid option '%1'").arg(key).toLocal8Bit().constData() << std::endl;
        }
        else if (master.isEmpty() && !m_options.contains(key))
        {
            master = key;
            m_options.insert(key, CastorArgument(Default, Flags, ExitImmediately));
            valid.append("-" + key);
        }
        else if (!master.isEmpty() && !m_aliases.contains(key) && !m_options.contains(key))
        {
            m_aliases.insert(key, master);
            valid.append("-" + key);
        }
        else
        {
            std::cout << QString("Command line option '%1' already in use - ignoring").arg(key).toLocal8Bit().constData() << std::endl;
        }
    }

    if (!valid.isEmpty())
    {
        QString options = valid.join(" OR ");
        m_help.insert(options, HelpText);
        if (options.size() + 2 > m_maxLength)
            m_maxLength = options.size() + 2;
    }
}

/// \brief Returns the value for the given key or an invalid QVariant if the option is not present.
QVariant CastorCommandLinePriv::GetValue(const QString &Key)
{
    if (m_options.contains(Key))
        return m_options.value(Key).m_value;

    if (m_aliases.contains(Key))
        return m_options.value(m_aliases.value(Key)).m_value;

    return QVariant();
}

void CastorCommandLinePriv::PrintHelp(void)
{
    std::cout << "Castor Version : " << CASTOR_SOURCE_VERSION << std::endl;
    std::cout << "Command line options for " << QCoreApplication::applicationName().toLocal8Bit().constData() << ":" << std::endl << std::endl;

    QMap<QString,QString>::const_iterator it = m_help.constBegin();
    for ( ; it != m_help.constEnd(); ++it)
    {
        QByteArray option(it.key().toLocal8Bit());
        QByteArray padding(qMax(1, m_maxLength - option.size()), ' ');
        std::cout << option.constData() << padding.constData() << it.value().toLocal8Bit().constData() << std::endl;
    }

    std::cout << std::endl << "All options may be preceeded by '-' or '--'" << std::endl;
}

/*! \brief Evaluate the command line paramaters
 *
 * Exit is set to true if any of the known options are discovered and require the application to exit
 * immediately (e.g. --help).
 *
 * Arguments can be preceeded by any number of '-'s. If a value is expected (the default value is a valid
 * QVariant) then the expected format is either --key=value or --key value.
 *
 * If there is a parsing error, the help text is printed and GENERIC_EXIT_INVALID_CMDLINE is returned.
*/
int CastorCommandLinePriv::Evaluate(int argc, const char * const *argv, bool &Exit)
{
    QString error;
    bool parserror    = false;
    bool printhelp    = false;
    bool printversion = false;

    for (int i = 1; i < argc; ++i)
    {
        QString key = QString::fromLocal8Bit(argv[i]);

        while (key.startsWith("-"))
            key = key.mid(1);

        QString value;

        // --key=value format
        bool simpleformat = key.contains("=");
        if (simpleformat)
        {
            int index = key.indexOf('=');
            value = key.mid(index + 1).trimmed();
            key   = key.left(index).trimmed();
        }

        if (!m_options.contains(key))
        {
            if (!m_aliases.contains(key))
            {
                parserror = true;
                error = QString("Unknown command line option '%1'").arg(key);
                break;
            }

            key = m_aliases.value(key);
        }

        CastorArgument &argument = m_options[key];

        // --key value format
        if (!simpleformat && argument.m_value.isValid())
        {
            if (i >= argc - 1)
            {
                parserror = true;
                error = QString("Insufficient arguments - option '%1' requires a value").arg(key);
                break;
            }

            value = QString::fromLocal8Bit(argv[++i]).trimmed();

            if (value.startsWith("-"))
            {
                parserror = true;
                error = QString("Option '%1' expects a value").arg(key);
                break;
            }
        }

        if (!argument.m_value.isValid())
        {
            if (!value.isEmpty())
            {
                parserror = true;
                error = QString("Option '%1' does not expect a value ('%2')").arg(key).arg(value);
                break;
            }

            // mark option as detected
            argument.m_value = QVariant((bool)true);
        }
        else if (value.isEmpty())
        {
            parserror = true;
            error = QString("Option '%1' expects a value").arg(key);
            break;
        }
        else
        {
            switch ((QMetaType::Type)argument.m_value.type())
            {
                case QMetaType::Int:
                {
                    bool ok = false;
                    int number = value.toInt(&ok);
                    if (!ok)
                    {
                        parserror = true;
                        error = QString("Option '%1' expects a number ('%2')").arg(key).arg(value);
                    }
                    argument.m_value = QVariant(number);
                    break;
                }
                case QMetaType::QStringList:
                    argument.m_value = QVariant(value.split(",", QString::SkipEmptyParts));
                    break;
                default:
                    argument.m_value = QVariant(value);
            }

            if (parserror)
                break;
        }

        Exit         |= argument.m_exitImmediately;
        printhelp    |= argument.m_flags.testFlag(CastorCommandLine::Help);
        printversion |= argument.m_flags.testFlag(CastorCommandLine::Version);
    }

    if (parserror)
    {
        Exit = true;
        std::cout << error.toLocal8Bit().constData() << std::endl << std::endl;
        PrintHelp();
        return GENERIC_EXIT_INVALID_CMDLINE;
    }

    if (printhelp)
        PrintHelp();

    if (printversion)
    {
        std::cout << "Castor Version : " << CASTOR_SOURCE_VERSION << std::endl;
        std::cout << "QT Version : "     << QT_VERSION_STR << std::endl;
    }

    return GENERIC_EXIT_OK;
}

/*! \class CastorCommandLine
 *  \brief Public implementation of Castor command line handler.
 *
 * CastorCommandLine will always add handling for help, loglevel, verbose and version handling.
 *
 * Custom command line options can be implemented by calling Add and retrieving the expected value via GetValue.
 * The type of the default value determines how a value is parsed: QStringList values are split on commas and
 * int values must be numeric.
*/
CastorCommandLine::CastorCommandLine(Options Flags)
  : m_priv(new CastorCommandLinePriv(Flags))
{
}

CastorCommandLine::~CastorCommandLine()
{
    delete m_priv;
}

/*! \brief Implement custom command line options.
 *
 * \param Keys            A comma separated list of synonymous command line options (e.g. "h,help").
 * \param Default         The default value AND type for an option (e.g. QString("info") or (int)0).
 * \param HelpText        Brief help text for the option.
 * \param ExitImmediately Tell the application to exit immediately after processing the command line.
*/
void CastorCommandLine::Add(const QString &Keys, const QVariant &Default, const QString &HelpText, bool ExitImmediately/*=false*/)
{
    m_priv->Add(Keys, Default, HelpText, CastorCommandLine::None, ExitImmediately);
}

int CastorCommandLine::Evaluate(int argc, const char * const *argv, bool &Exit)
{
    return m_priv->Evaluate(argc, argv, Exit);
}

/*! \brief Return the value associated with Key or an invalid QVariant if the option is not present.
 *
 * \note In the case of options that require no value (e.g. --help), QVariant((bool)true) is returned if
 *       the option was detected.
*/
QVariant CastorCommandLine::GetValue(const QString &Key)
{
    return m_priv->GetValue(Key);
}
