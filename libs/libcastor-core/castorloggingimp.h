#ifndef CASTORLOGGINGIMP_H
#define CASTORLOGGINGIMP_H

#define LOGLINE_MAX (2048-120)

class QFile;
class LogItem;

class LoggerBase
{
  public:
    explicit LoggerBase(const QString &FileName);
    virtual ~LoggerBase();

    virtual bool Logmsg(LogItem *Item) = 0;

  protected:
    QString      m_fileName;
};

class FileLogger : public LoggerBase
{
  public:
    explicit FileLogger(const QString &Filename);
   ~FileLogger();

    bool   Logmsg(LogItem *Item);

  private:
    bool   m_opened;
    QFile *m_file;
};

#endif // CASTORLOGGINGIMP_H
